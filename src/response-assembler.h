#pragma once

#include "batch-scheduler.h"
#include "byte-channel.h"
#include "proxy-common.h"
#include "synthesis-client.h"
#include "text-chunker.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace edge_tts {

// Runs the whole pipeline and concatenates every unit's audio in order.
bool assemble_buffered(
        batch_scheduler & scheduler,
        const std::vector<text_unit> & units,
        int32_t requested_concurrency,
        const voice_params & params,
        std::string & body,
        proxy_error & err);

// Streaming response: a background producer runs the batch loop and pushes
// each finished batch into the channel. The channel is closed on success and
// aborted on the first failure.
//
// The scheduler must outlive the session. Destroying the session cancels the
// channel and joins the producer.
class stream_session {
public:
    stream_session(
            batch_scheduler & scheduler,
            std::vector<text_unit> units,
            int32_t requested_concurrency,
            voice_params params,
            size_t channel_capacity = 8);
    ~stream_session();

    stream_session(const stream_session &) = delete;
    stream_session & operator=(const stream_session &) = delete;

    void start();

    byte_channel & channel() { return *channel_; }

    size_t n_units() const { return n_units_; }
    int32_t effective() const { return effective_; }

private:
    batch_scheduler & scheduler_;
    std::vector<text_unit> units_;
    int32_t requested_concurrency_;
    voice_params params_;
    size_t n_units_;
    int32_t effective_;

    std::shared_ptr<byte_channel> channel_;
    std::thread producer_;
};

void run_stream_producer(
        batch_scheduler & scheduler,
        const std::vector<text_unit> & units,
        int32_t requested_concurrency,
        const voice_params & params,
        byte_channel & channel);

} // namespace edge_tts
