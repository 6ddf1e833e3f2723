#include <catch2/catch_test_macros.hpp>

#include "error.hpp"
#include "retry_policy.hpp"

#include <chrono>
#include <cstdint>

using namespace std::chrono_literals;

TEST_CASE("RetryPolicy", "[retry]") {

    SECTION("Defaults") {
        RetryPolicy p;
        REQUIRE(p.max_retries == 2);
        REQUIRE(p.base_delay == 500ms);
        REQUIRE(p.timeout == 6000ms);
        REQUIRE(p.total_attempts() == 3);
    }

    SECTION("ExponentialDelay") {
        RetryPolicy p{.max_retries = 6, .base_delay = 100ms};
        REQUIRE(p.delay(0) == 0ms);
        for (uint32_t k = 1; k <= 6; ++k) {
            REQUIRE(p.delay(k) == 100ms * (1 << (k - 1)));
        }
    }

    SECTION("ZeroRetries") {
        RetryPolicy p{.max_retries = 0};
        REQUIRE(p.total_attempts() == 1);
    }

    SECTION("LargeRetryCountsDoNotOverflow") {
        RetryPolicy p{.max_retries = 4294967295u};
        REQUIRE(p.total_attempts() == 4294967296ull);

        RetryPolicy q{.base_delay = 500ms};
        REQUIRE(q.delay(64) == std::chrono::milliseconds::max());
        REQUIRE(q.delay(65) == std::chrono::milliseconds::max());
        REQUIRE(q.delay(RetryPolicy::kMaxRetries) == 500ms * (int64_t{1} << 29));

        // Never shrinks as attempts grow.
        for (uint64_t k = 1; k < 100; ++k) {
            REQUIRE(q.delay(k + 1) >= q.delay(k));
        }
    }

    SECTION("ErrorClassification") {
        REQUIRE(AsrError::network("down").is_retryable());
        REQUIRE(AsrError::timeout(6000).is_retryable());
        REQUIRE_FALSE(AsrError::auth_failed("qwen", "bad key").is_retryable());
        REQUIRE_FALSE(AsrError::quota_exceeded("qwen").is_retryable());
        REQUIRE_FALSE(AsrError::wire("bad frame").is_retryable());

        REQUIRE(AsrError::invalid_audio("empty").is_fail_fast());
        REQUIRE(AsrError::config("missing key").is_fail_fast());
        REQUIRE(AsrError::unsupported("no streaming").is_fail_fast());
        REQUIRE_FALSE(AsrError::auth_failed("doubao", "x").is_fail_fast());
        REQUIRE_FALSE(AsrError::network("x").is_fail_fast());
    }

    SECTION("ErrorText") {
        REQUIRE(AsrError::timeout(6000).to_string() == "request timed out (6000ms)");
        REQUIRE(AsrError::quota_exceeded("sensevoice").to_string() == "quota exceeded (sensevoice)");

        auto all = AsrError::all_engines_failed("a; b", std::nullopt);
        REQUIRE(all.kind == AsrErrorKind::AllEnginesFailed);
        REQUIRE(all.to_string() == "all engines failed: primary=[a; b], fallback=[none]");

        auto with_fallback = AsrError::all_engines_failed("a", "c");
        REQUIRE(with_fallback.fallback_message == "c");
    }
}
