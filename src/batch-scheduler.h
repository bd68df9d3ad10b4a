#pragma once

#include "credential-cache.h"
#include "proxy-common.h"
#include "synthesis-client.h"
#include "text-chunker.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace edge_tts {

static constexpr int32_t k_default_concurrency = 10;
static constexpr int32_t k_min_batch_concurrency = 5;
static constexpr int32_t k_min_batches = 3;

struct audio_unit {
    int32_t index = 0;
    std::string bytes;
};

// min(requested, n_units, max(5, ceil(n_units / 3))), at least 1 when there
// is anything to do.
int32_t effective_concurrency(int32_t requested, size_t n_units);

// Drives text units through credential_cache + synthesis_client in strictly
// sequential batches of `effective_concurrency` concurrent calls. The first
// failure aborts the run: no partial output, no retry, no further batches.
class batch_scheduler {
public:
    // Receives each completed batch in input order. Returning false stops the
    // run with `err`.
    using batch_callback = std::function<bool(std::vector<audio_unit> & batch, proxy_error & err)>;

    batch_scheduler(credential_cache & creds, synthesis_client & synth);

    bool run(
            const std::vector<text_unit> & units,
            int32_t requested_concurrency,
            const voice_params & params,
            std::vector<audio_unit> & out,
            proxy_error & err);

    bool run_batches(
            const std::vector<text_unit> & units,
            int32_t requested_concurrency,
            const voice_params & params,
            const batch_callback & on_batch,
            proxy_error & err);

private:
    bool synthesize_unit(const text_unit & unit, const voice_params & params, audio_unit & out, proxy_error & err);

    credential_cache & creds_;
    synthesis_client & synth_;
};

} // namespace edge_tts
