#include "batch-scheduler.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <utility>

namespace edge_tts {

namespace {

struct unit_result {
    bool ok = false;
    int64_t done_seq = 0;
    audio_unit audio;
    proxy_error err;
};

} // namespace

int32_t effective_concurrency(int32_t requested, size_t n_units) {
    if (n_units == 0) {
        return 0;
    }
    const int64_t n = (int64_t) n_units;
    const int64_t per_batch_floor = std::max<int64_t>(k_min_batch_concurrency, (n + k_min_batches - 1) / k_min_batches);
    const int64_t eff = std::min<int64_t>(std::min<int64_t>(requested, n), per_batch_floor);
    return (int32_t) std::max<int64_t>(1, eff);
}

batch_scheduler::batch_scheduler(credential_cache & creds, synthesis_client & synth)
    : creds_(creds), synth_(synth) {
}

bool batch_scheduler::synthesize_unit(const text_unit & unit, const voice_params & params, audio_unit & out, proxy_error & err) {
    try {
        credential cred;
        if (!creds_.get(cred, err)) {
            return false;
        }
        out.index = unit.index;
        if (!synth_.synthesize(unit.content, params, cred, out.bytes, err)) {
            if (err.kind == ERROR_KIND_NONE) {
                err.kind = ERROR_KIND_SYNTHESIS;
            }
            err.message = "unit " + std::to_string(unit.index) + ": " + err.message;
            return false;
        }
    } catch (const std::exception & e) {
        set_error(err, ERROR_KIND_INTERNAL, 0, "unit " + std::to_string(unit.index) + ": " + e.what());
        return false;
    }
    return true;
}

bool batch_scheduler::run_batches(
        const std::vector<text_unit> & units,
        int32_t requested_concurrency,
        const voice_params & params,
        const batch_callback & on_batch,
        proxy_error & err) {
    const int32_t eff = effective_concurrency(requested_concurrency, units.size());
    if (eff == 0) {
        return true;
    }

    for (size_t begin = 0; begin < units.size(); begin += (size_t) eff) {
        const size_t end = std::min(units.size(), begin + (size_t) eff);

        std::atomic<int64_t> done_seq {0};
        std::vector<std::future<unit_result>> tasks;
        tasks.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            const text_unit & unit = units[i];
            tasks.push_back(std::async(std::launch::async, [this, &unit, &params, &done_seq]() {
                unit_result r;
                r.ok = synthesize_unit(unit, params, r.audio, r.err);
                r.done_seq = done_seq.fetch_add(1);
                return r;
            }));
        }

        // The whole batch settles before anything is reported or started.
        std::vector<unit_result> results;
        results.reserve(tasks.size());
        for (auto & t : tasks) {
            results.push_back(t.get());
        }

        const unit_result * first_failure = nullptr;
        for (const auto & r : results) {
            if (!r.ok && (first_failure == nullptr || r.done_seq < first_failure->done_seq)) {
                first_failure = &r;
            }
        }
        if (first_failure != nullptr) {
            err = first_failure->err;
            return false;
        }

        std::vector<audio_unit> batch;
        batch.reserve(results.size());
        for (auto & r : results) {
            batch.push_back(std::move(r.audio));
        }
        if (!on_batch(batch, err)) {
            return false;
        }
    }
    return true;
}

bool batch_scheduler::run(
        const std::vector<text_unit> & units,
        int32_t requested_concurrency,
        const voice_params & params,
        std::vector<audio_unit> & out,
        proxy_error & err) {
    std::vector<audio_unit> collected;
    collected.reserve(units.size());
    const bool ok = run_batches(units, requested_concurrency, params,
            [&collected](std::vector<audio_unit> & batch, proxy_error &) {
                for (auto & a : batch) {
                    collected.push_back(std::move(a));
                }
                return true;
            }, err);
    if (!ok) {
        return false;
    }
    out = std::move(collected);
    return true;
}

} // namespace edge_tts
