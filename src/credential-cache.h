#pragma once

#include "proxy-common.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <string>

namespace edge_tts {

static constexpr int64_t k_default_refresh_skew_sec = 5 * 60;

struct credential {
    nlohmann::ordered_json endpoint; // raw record from the token endpoint
    std::string region;
    std::string token;
    int64_t expires_at = 0;          // unix seconds
};

// Performs one round trip to the backend's token-issuance endpoint.
class token_issuer {
public:
    virtual ~token_issuer() = default;

    virtual bool issue(credential & out, proxy_error & err) = 0;
};

// Process-wide credential with singleflight refresh. Callers that find the
// credential missing or inside the refresh window either start the refresh or
// join the one already in flight; every joiner gets the leader's result.
//
// invalidate() drops the cached credential and forgets an in-flight refresh
// without cancelling it. When that refresh lands its credential is still
// installed unless a newer refresh has already installed one, and it never
// clears the flags of a refresh started after the invalidate.
class credential_cache {
public:
    explicit credential_cache(
            token_issuer & issuer,
            int64_t refresh_skew_sec = k_default_refresh_skew_sec,
            std::function<int64_t()> clock = nullptr);

    credential_cache(const credential_cache &) = delete;
    credential_cache & operator=(const credential_cache &) = delete;

    bool get(credential & out, proxy_error & err);
    void invalidate();

    bool has_valid() const;
    bool is_refreshing() const;
    int64_t refresh_count() const;

private:
    struct refresh_result {
        bool ok = false;
        credential cred;
        proxy_error err;
    };

    bool is_fresh_locked(int64_t now) const;

    token_issuer & issuer_;
    const int64_t refresh_skew_sec_;
    std::function<int64_t()> clock_;

    mutable std::mutex mtx_;
    bool has_credential_ = false;
    credential current_;
    bool refreshing_ = false;
    uint64_t generation_ = 0;
    uint64_t installed_generation_ = 0;
    std::shared_future<refresh_result> inflight_;

    std::atomic<int64_t> n_refresh_ {0};
};

} // namespace edge_tts
