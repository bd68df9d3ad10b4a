#pragma once

#include "proxy-common.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

namespace edge_tts {

// Bounded single-producer/single-consumer byte queue between the synthesis
// producer and the HTTP body writer. The producer finishes it exactly once
// with close() or abort(); the consumer may cancel() when the client is gone.
class byte_channel {
public:
    enum read_status {
        READ_DATA    = 0,
        READ_EOF     = 1,
        READ_ABORTED = 2,
    };

    explicit byte_channel(size_t capacity = 8);

    byte_channel(const byte_channel &) = delete;
    byte_channel & operator=(const byte_channel &) = delete;

    // Blocks while the queue is full. Returns false once the channel is
    // finished or cancelled; the data is dropped in that case.
    bool write(std::string data);

    // Both return false if the channel was already finished.
    bool close();
    bool abort(const proxy_error & err);

    void cancel();

    // Blocks until a chunk is available or the channel is finished. Queued
    // chunks are drained before EOF or the abort error is reported.
    read_status read(std::string & out, proxy_error & err);

    // Like read() without consuming: READ_DATA means a chunk is queued.
    read_status wait_ready(proxy_error & err);

    bool is_finished() const;
    bool is_cancelled() const;
    size_t bytes_written() const;

private:
    enum channel_state {
        STATE_OPEN    = 0,
        STATE_CLOSED  = 1,
        STATE_ABORTED = 2,
    };

    const size_t capacity_;

    mutable std::mutex mtx_;
    std::condition_variable cv_readable_;
    std::condition_variable cv_writable_;
    std::deque<std::string> queue_;
    channel_state state_ = STATE_OPEN;
    bool cancelled_ = false;
    proxy_error abort_err_;
    size_t bytes_written_ = 0;
};

// Finishes a channel on scope exit: close() or abort() may be called
// explicitly, otherwise the destructor aborts with an internal error.
class channel_guard {
public:
    explicit channel_guard(byte_channel & ch);
    ~channel_guard();

    channel_guard(const channel_guard &) = delete;
    channel_guard & operator=(const channel_guard &) = delete;

    void close();
    void abort(const proxy_error & err);

private:
    byte_channel & ch_;
    bool done_ = false;
};

} // namespace edge_tts
