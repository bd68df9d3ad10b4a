#include "byte-channel.h"

#include <utility>

namespace edge_tts {

byte_channel::byte_channel(size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {
}

bool byte_channel::write(std::string data) {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_writable_.wait(lock, [&]() {
        return queue_.size() < capacity_ || state_ != STATE_OPEN || cancelled_;
    });
    if (state_ != STATE_OPEN || cancelled_) {
        return false;
    }
    bytes_written_ += data.size();
    queue_.push_back(std::move(data));
    lock.unlock();
    cv_readable_.notify_one();
    return true;
}

bool byte_channel::close() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ != STATE_OPEN) {
            return false;
        }
        state_ = STATE_CLOSED;
    }
    cv_readable_.notify_all();
    cv_writable_.notify_all();
    return true;
}

bool byte_channel::abort(const proxy_error & err) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ != STATE_OPEN) {
            return false;
        }
        state_ = STATE_ABORTED;
        abort_err_ = err;
    }
    cv_readable_.notify_all();
    cv_writable_.notify_all();
    return true;
}

void byte_channel::cancel() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        cancelled_ = true;
        queue_.clear();
    }
    cv_readable_.notify_all();
    cv_writable_.notify_all();
}

byte_channel::read_status byte_channel::read(std::string & out, proxy_error & err) {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_readable_.wait(lock, [&]() {
        return !queue_.empty() || state_ != STATE_OPEN || cancelled_;
    });
    if (!queue_.empty()) {
        out = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        cv_writable_.notify_one();
        return READ_DATA;
    }
    if (state_ == STATE_CLOSED) {
        return READ_EOF;
    }
    if (state_ == STATE_ABORTED) {
        err = abort_err_;
        return READ_ABORTED;
    }
    set_error(err, ERROR_KIND_STREAM_ABORT, 499, "stream cancelled by consumer");
    return READ_ABORTED;
}

byte_channel::read_status byte_channel::wait_ready(proxy_error & err) {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_readable_.wait(lock, [&]() {
        return !queue_.empty() || state_ != STATE_OPEN || cancelled_;
    });
    if (!queue_.empty()) {
        return READ_DATA;
    }
    if (state_ == STATE_CLOSED) {
        return READ_EOF;
    }
    if (state_ == STATE_ABORTED) {
        err = abort_err_;
        return READ_ABORTED;
    }
    set_error(err, ERROR_KIND_STREAM_ABORT, 499, "stream cancelled by consumer");
    return READ_ABORTED;
}

bool byte_channel::is_finished() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_ != STATE_OPEN;
}

bool byte_channel::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return cancelled_;
}

size_t byte_channel::bytes_written() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return bytes_written_;
}

channel_guard::channel_guard(byte_channel & ch) : ch_(ch) {
}

channel_guard::~channel_guard() {
    if (!done_) {
        proxy_error err;
        set_error(err, ERROR_KIND_INTERNAL, 500, "stream producer exited without finishing the stream");
        ch_.abort(err);
    }
}

void channel_guard::close() {
    if (!done_) {
        done_ = true;
        ch_.close();
    }
}

void channel_guard::abort(const proxy_error & err) {
    if (!done_) {
        done_ = true;
        ch_.abort(err);
    }
}

} // namespace edge_tts
