#include <gtest/gtest.h>

#include "credential-cache.h"
#include "test-fakes.h"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace edge_tts;
using edge_tts::testing_fakes::fake_issuer;

namespace {

struct fake_clock {
    std::atomic<int64_t> now {1000000};

    std::function<int64_t()> fn() {
        return [this]() { return now.load(); };
    }
};

// Releases the issuer only after `n` callers have entered get(), so every one
// of them finds the refresh already in flight.
void gate_issuer_on(fake_issuer & issuer, std::atomic<int32_t> & entered, int32_t n) {
    issuer.before_issue = [&entered, n]() {
        while (entered.load() < n) {
            std::this_thread::yield();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    };
}

}  // namespace

TEST(CredentialCacheTest, ConcurrentCallersShareOneRefresh) {
    fake_clock clock;
    fake_issuer issuer(clock.fn());
    credential_cache cache(issuer, 300, clock.fn());

    constexpr int32_t n_threads = 16;
    std::atomic<int32_t> entered {0};
    gate_issuer_on(issuer, entered, n_threads);

    std::vector<std::string> tokens(n_threads);
    std::vector<int> oks(n_threads, 0);
    std::vector<std::thread> threads;
    for (int32_t i = 0; i < n_threads; ++i) {
        threads.emplace_back([&, i]() {
            credential cred;
            proxy_error err;
            entered.fetch_add(1);
            oks[i] = cache.get(cred, err) ? 1 : 0;
            tokens[i] = cred.token;
        });
    }
    for (auto & t : threads) {
        t.join();
    }

    EXPECT_EQ(issuer.calls.load(), 1);
    EXPECT_EQ(cache.refresh_count(), 1);
    for (int32_t i = 0; i < n_threads; ++i) {
        EXPECT_EQ(oks[i], 1);
        EXPECT_EQ(tokens[i], "token-1");
    }
    EXPECT_TRUE(cache.has_valid());
    EXPECT_FALSE(cache.is_refreshing());
}

TEST(CredentialCacheTest, FreshCredentialIsReused) {
    fake_clock clock;
    fake_issuer issuer(clock.fn(), 600);
    credential_cache cache(issuer, 300, clock.fn());

    credential a;
    credential b;
    proxy_error err;
    ASSERT_TRUE(cache.get(a, err));
    ASSERT_TRUE(cache.get(b, err));
    EXPECT_EQ(issuer.calls.load(), 1);
    EXPECT_EQ(a.token, b.token);
    EXPECT_EQ(a.region, "testregion");
    EXPECT_EQ(a.expires_at, clock.now.load() + 600);
}

TEST(CredentialCacheTest, RefreshesInsideSkewWindow) {
    fake_clock clock;
    const int64_t t0 = clock.now.load();
    fake_issuer issuer(clock.fn(), 1000);
    credential_cache cache(issuer, 300, clock.fn());

    credential cred;
    proxy_error err;
    ASSERT_TRUE(cache.get(cred, err));
    EXPECT_EQ(cred.token, "token-1");

    // expires at t0 + 1000, so it stays fresh while now < t0 + 700
    clock.now = t0 + 699;
    ASSERT_TRUE(cache.get(cred, err));
    EXPECT_EQ(cred.token, "token-1");
    EXPECT_TRUE(cache.has_valid());

    clock.now = t0 + 700;
    EXPECT_FALSE(cache.has_valid());
    ASSERT_TRUE(cache.get(cred, err));
    EXPECT_EQ(cred.token, "token-2");
    EXPECT_EQ(issuer.calls.load(), 2);
}

TEST(CredentialCacheTest, FailureIsSharedByAllWaitersAndNotCached) {
    fake_clock clock;
    fake_issuer issuer(clock.fn());
    issuer.fail = true;
    credential_cache cache(issuer, 300, clock.fn());

    constexpr int32_t n_threads = 8;
    std::atomic<int32_t> entered {0};
    gate_issuer_on(issuer, entered, n_threads);

    std::vector<proxy_error> errs(n_threads);
    std::vector<int> oks(n_threads, 1);
    std::vector<std::thread> threads;
    for (int32_t i = 0; i < n_threads; ++i) {
        threads.emplace_back([&, i]() {
            credential cred;
            entered.fetch_add(1);
            oks[i] = cache.get(cred, errs[i]) ? 1 : 0;
        });
    }
    for (auto & t : threads) {
        t.join();
    }

    EXPECT_EQ(issuer.calls.load(), 1);
    for (int32_t i = 0; i < n_threads; ++i) {
        EXPECT_EQ(oks[i], 0);
        EXPECT_EQ(errs[i].kind, ERROR_KIND_CREDENTIAL);
        EXPECT_EQ(errs[i].message, "token refresh failed: issuer unavailable");
    }
    EXPECT_FALSE(cache.has_valid());
    EXPECT_FALSE(cache.is_refreshing());

    // the next caller starts a new refresh
    issuer.before_issue = nullptr;
    issuer.fail = false;
    credential cred;
    proxy_error err;
    ASSERT_TRUE(cache.get(cred, err));
    EXPECT_EQ(cred.token, "token-2");
    EXPECT_EQ(issuer.calls.load(), 2);
}

TEST(CredentialCacheTest, InvalidateForcesRefresh) {
    fake_clock clock;
    fake_issuer issuer(clock.fn());
    credential_cache cache(issuer, 300, clock.fn());

    credential cred;
    proxy_error err;
    ASSERT_TRUE(cache.get(cred, err));
    ASSERT_TRUE(cache.has_valid());

    cache.invalidate();
    EXPECT_FALSE(cache.has_valid());

    ASSERT_TRUE(cache.get(cred, err));
    EXPECT_EQ(cred.token, "token-2");
    EXPECT_EQ(cache.refresh_count(), 2);
}

TEST(CredentialCacheTest, ReportsRefreshInFlight) {
    fake_clock clock;
    fake_issuer issuer(clock.fn());
    std::atomic<bool> release {false};
    std::atomic<bool> issuing {false};
    issuer.before_issue = [&]() {
        issuing = true;
        while (!release.load()) {
            std::this_thread::yield();
        }
    };
    credential_cache cache(issuer, 300, clock.fn());

    std::thread caller([&]() {
        credential cred;
        proxy_error err;
        EXPECT_TRUE(cache.get(cred, err));
    });
    while (!issuing.load()) {
        std::this_thread::yield();
    }
    EXPECT_TRUE(cache.is_refreshing());
    EXPECT_FALSE(cache.has_valid());

    release = true;
    caller.join();
    EXPECT_FALSE(cache.is_refreshing());
    EXPECT_TRUE(cache.has_valid());
}

TEST(CredentialCacheTest, InvalidateDuringRefreshStillInstallsResult) {
    fake_clock clock;
    fake_issuer issuer(clock.fn());
    std::atomic<bool> release {false};
    std::atomic<bool> issuing {false};
    issuer.before_issue = [&]() {
        issuing = true;
        while (!release.load()) {
            std::this_thread::yield();
        }
    };
    credential_cache cache(issuer, 300, clock.fn());

    bool ok = false;
    std::string token;
    std::thread caller([&]() {
        credential cred;
        proxy_error err;
        ok = cache.get(cred, err);
        token = cred.token;
    });
    while (!issuing.load()) {
        std::this_thread::yield();
    }

    cache.invalidate();
    EXPECT_FALSE(cache.is_refreshing());
    EXPECT_FALSE(cache.has_valid());

    release = true;
    caller.join();
    EXPECT_TRUE(ok);
    EXPECT_EQ(token, "token-1");
    EXPECT_TRUE(cache.has_valid());
    EXPECT_FALSE(cache.is_refreshing());
    EXPECT_EQ(issuer.calls.load(), 1);
}

TEST(CredentialCacheTest, StaleRefreshKeepsNewerRefreshInFlight) {
    fake_clock clock;
    fake_issuer issuer(clock.fn());
    std::atomic<int32_t> entered {0};
    std::atomic<bool> release_first {false};
    std::atomic<bool> release_second {false};
    issuer.before_issue = [&]() {
        const int32_t k = ++entered;
        std::atomic<bool> & gate = k == 1 ? release_first : release_second;
        while (!gate.load()) {
            std::this_thread::yield();
        }
    };
    credential_cache cache(issuer, 300, clock.fn());

    std::string first_token;
    std::thread first([&]() {
        credential cred;
        proxy_error err;
        EXPECT_TRUE(cache.get(cred, err));
        first_token = cred.token;
    });
    while (entered.load() < 1) {
        std::this_thread::yield();
    }

    cache.invalidate();

    std::string second_token;
    std::thread second([&]() {
        credential cred;
        proxy_error err;
        EXPECT_TRUE(cache.get(cred, err));
        second_token = cred.token;
    });
    while (entered.load() < 2) {
        std::this_thread::yield();
    }
    EXPECT_TRUE(cache.is_refreshing());

    // the stale refresh lands first: its credential is usable, but the newer
    // refresh is still in flight
    release_first = true;
    first.join();
    EXPECT_EQ(first_token, "token-1");
    EXPECT_TRUE(cache.has_valid());
    EXPECT_TRUE(cache.is_refreshing());

    release_second = true;
    second.join();
    EXPECT_EQ(second_token, "token-2");
    EXPECT_FALSE(cache.is_refreshing());
    EXPECT_EQ(cache.refresh_count(), 2);

    credential cred;
    proxy_error err;
    ASSERT_TRUE(cache.get(cred, err));
    EXPECT_EQ(cred.token, "token-2");
}

TEST(CredentialCacheTest, StaleRefreshDoesNotOverwriteNewerCredential) {
    fake_clock clock;
    fake_issuer issuer(clock.fn());
    std::atomic<int32_t> entered {0};
    std::atomic<bool> release_first {false};
    issuer.before_issue = [&]() {
        if (++entered == 1) {
            while (!release_first.load()) {
                std::this_thread::yield();
            }
            issuer.fail = true;
        }
    };
    credential_cache cache(issuer, 300, clock.fn());

    bool first_ok = true;
    std::thread first([&]() {
        credential cred;
        proxy_error err;
        first_ok = cache.get(cred, err);
    });
    while (entered.load() < 1) {
        std::this_thread::yield();
    }

    cache.invalidate();

    credential cred;
    proxy_error err;
    ASSERT_TRUE(cache.get(cred, err));
    EXPECT_EQ(cred.token, "token-2");

    // the stale refresh fails after the newer one landed
    release_first = true;
    first.join();
    EXPECT_FALSE(first_ok);
    EXPECT_TRUE(cache.has_valid());

    issuer.fail = false;
    ASSERT_TRUE(cache.get(cred, err));
    EXPECT_EQ(cred.token, "token-2");
    EXPECT_EQ(issuer.calls.load(), 2);
}
