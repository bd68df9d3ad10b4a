#include "response-assembler.h"

#include <cstdio>
#include <exception>
#include <utility>

namespace edge_tts {

bool assemble_buffered(
        batch_scheduler & scheduler,
        const std::vector<text_unit> & units,
        int32_t requested_concurrency,
        const voice_params & params,
        std::string & body,
        proxy_error & err) {
    std::vector<audio_unit> audio;
    if (!scheduler.run(units, requested_concurrency, params, audio, err)) {
        return false;
    }

    size_t total = 0;
    for (const auto & a : audio) {
        total += a.bytes.size();
    }
    body.clear();
    body.reserve(total);
    for (const auto & a : audio) {
        body += a.bytes;
    }
    return true;
}

void run_stream_producer(
        batch_scheduler & scheduler,
        const std::vector<text_unit> & units,
        int32_t requested_concurrency,
        const voice_params & params,
        byte_channel & channel) {
    channel_guard guard(channel);

    proxy_error err;
    bool ok = false;
    try {
        ok = scheduler.run_batches(units, requested_concurrency, params,
                [&channel](std::vector<audio_unit> & batch, proxy_error & e) {
                    for (auto & a : batch) {
                        if (!channel.write(std::move(a.bytes))) {
                            set_error(e, ERROR_KIND_STREAM_ABORT, 499, "stream consumer went away");
                            return false;
                        }
                    }
                    return true;
                }, err);
    } catch (const std::exception & e) {
        set_error(err, ERROR_KIND_INTERNAL, 500, e.what());
        ok = false;
    }

    if (ok) {
        guard.close();
        return;
    }
    if (channel.bytes_written() > 0 && err.kind != ERROR_KIND_STREAM_ABORT) {
        std::fprintf(stderr, "warn: aborting stream after %zu bytes: %s\n", channel.bytes_written(), err.message.c_str());
    }
    guard.abort(err);
}

stream_session::stream_session(
        batch_scheduler & scheduler,
        std::vector<text_unit> units,
        int32_t requested_concurrency,
        voice_params params,
        size_t channel_capacity)
    : scheduler_(scheduler),
      units_(std::move(units)),
      requested_concurrency_(requested_concurrency),
      params_(std::move(params)),
      n_units_(units_.size()),
      effective_(effective_concurrency(requested_concurrency, units_.size())),
      channel_(std::make_shared<byte_channel>(channel_capacity)) {
}

stream_session::~stream_session() {
    channel_->cancel();
    if (producer_.joinable()) {
        producer_.join();
    }
}

void stream_session::start() {
    if (producer_.joinable()) {
        return;
    }
    // The producer owns copies of everything except the scheduler, so the
    // session can be torn down from any thread but the producer's own.
    auto ch = channel_;
    producer_ = std::thread([&sched = scheduler_, units = units_, conc = requested_concurrency_, params = params_, ch]() {
        run_stream_producer(sched, units, conc, params, *ch);
    });
}

} // namespace edge_tts
