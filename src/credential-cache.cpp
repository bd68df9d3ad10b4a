#include "credential-cache.h"

#include <cstdio>
#include <exception>
#include <utility>

namespace edge_tts {

credential_cache::credential_cache(
        token_issuer & issuer,
        int64_t refresh_skew_sec,
        std::function<int64_t()> clock)
    : issuer_(issuer),
      refresh_skew_sec_(refresh_skew_sec),
      clock_(clock ? std::move(clock) : std::function<int64_t()>(now_sec)) {
}

bool credential_cache::is_fresh_locked(int64_t now) const {
    return has_credential_ && !current_.token.empty() && now < current_.expires_at - refresh_skew_sec_;
}

bool credential_cache::get(credential & out, proxy_error & err) {
    std::promise<refresh_result> promise;
    std::shared_future<refresh_result> pending;
    bool leader = false;
    uint64_t generation = 0;

    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (is_fresh_locked(clock_())) {
            out = current_;
            return true;
        }
        if (refreshing_ && inflight_.valid()) {
            pending = inflight_;
        } else {
            leader = true;
            refreshing_ = true;
            generation = ++generation_;
            pending = promise.get_future().share();
            inflight_ = pending;
        }
    }

    if (leader) {
        refresh_result r;
        try {
            r.ok = issuer_.issue(r.cred, r.err);
        } catch (const std::exception & e) {
            r.ok = false;
            set_error(r.err, ERROR_KIND_CREDENTIAL, 0, e.what());
        }
        if (!r.ok) {
            r.err.kind = ERROR_KIND_CREDENTIAL;
            r.err.message = "token refresh failed: " + r.err.message;
        }
        n_refresh_.fetch_add(1);

        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (r.ok) {
                if (generation > installed_generation_) {
                    current_ = r.cred;
                    has_credential_ = true;
                    installed_generation_ = generation;
                }
            } else if (generation == generation_) {
                current_ = credential();
                has_credential_ = false;
            }
            // invalidate() or a newer refresh may own the flags by now
            if (generation == generation_) {
                refreshing_ = false;
                inflight_ = std::shared_future<refresh_result>();
            }
        }

        if (r.ok) {
            std::fprintf(stderr, "info: token refreshed: region=%s expires_at=%lld\n",
                    r.cred.region.c_str(), (long long) r.cred.expires_at);
        } else {
            std::fprintf(stderr, "error: %s\n", r.err.message.c_str());
        }
        promise.set_value(std::move(r));
    }

    const refresh_result & r = pending.get();
    if (!r.ok) {
        err = r.err;
        return false;
    }
    out = r.cred;
    return true;
}

void credential_cache::invalidate() {
    std::lock_guard<std::mutex> lock(mtx_);
    current_ = credential();
    has_credential_ = false;
    refreshing_ = false;
    inflight_ = std::shared_future<refresh_result>();
    ++generation_;
}

bool credential_cache::has_valid() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return is_fresh_locked(clock_());
}

bool credential_cache::is_refreshing() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return refreshing_;
}

int64_t credential_cache::refresh_count() const {
    return n_refresh_.load();
}

} // namespace edge_tts
