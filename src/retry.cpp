#include "foundry/retry.hpp"
#include "foundry/errors.hpp"
#include "foundry/sanitize.hpp"

#include <plog/Log.h>

#include <cstdlib>
#include <random>
#include <sstream>
#include <thread>

namespace foundry {

// =============================================================================
// RetryPolicy
// =============================================================================

RetryPolicy::RetryPolicy()
    : max_retries_(DEFAULT_MAX_RETRIES)
    , initial_backoff_(DEFAULT_INITIAL_BACKOFF_MS)
{}

RetryPolicy::RetryPolicy(int max_retries, std::chrono::milliseconds initial_backoff)
    : max_retries_(max_retries)
    , initial_backoff_(initial_backoff)
{}

RetryPolicy RetryPolicy::create(int max_retries, std::chrono::milliseconds initial_backoff) {
    if (max_retries < 0 || max_retries > MAX_RETRIES_LIMIT) {
        std::ostringstream oss;
        oss << "max_retries must be between 0 and " << MAX_RETRIES_LIMIT
            << ", got " << max_retries;
        throw ConfigurationError(oss.str());
    }
    if (initial_backoff.count() < 0 || initial_backoff.count() > MAX_BACKOFF_MS) {
        std::ostringstream oss;
        oss << "initial_backoff must be between 0 and " << MAX_BACKOFF_MS
            << "ms, got " << initial_backoff.count() << "ms";
        throw ConfigurationError(oss.str());
    }
    return RetryPolicy(max_retries, initial_backoff);
}

RetryPolicy RetryPolicy::none() {
    return RetryPolicy(0, std::chrono::milliseconds(0));
}

// =============================================================================
// Delay computation
// =============================================================================

bool is_retriable_status(int status) {
    return status == 429 || status == 502 || status == 503 || status == 504;
}

/** Strict non-negative decimal integer; surrounding blanks allowed. */
static bool parse_non_negative(const std::string& raw, long long& out) {
    size_t b = raw.find_first_not_of(" \t");
    size_t e = raw.find_last_not_of(" \t");
    if (b == std::string::npos) return false;

    std::string s = raw.substr(b, e - b + 1);
    if (s.size() > 12) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] < '0' || s[i] > '9') return false;
    }
    out = std::strtoll(s.c_str(), NULL, 10);
    return true;
}

bool parse_retry_hint(const Headers& headers, std::chrono::milliseconds& delay) {
    long long value = 0;

    Headers::const_iterator ms = headers.find("retry-after-ms");
    if (ms != headers.end() && parse_non_negative(ms->second, value)) {
        delay = std::chrono::milliseconds(value);
        return true;
    }

    Headers::const_iterator secs = headers.find("retry-after");
    if (secs != headers.end() && parse_non_negative(secs->second, value)) {
        delay = std::chrono::milliseconds(value * 1000);
        return true;
    }
    return false;
}

std::chrono::milliseconds compute_backoff(const RetryPolicy& policy, int attempt, double jitter) {
    long long base = policy.initial_backoff().count();
    for (int i = 0; i < attempt && base < MAX_BACKOFF_MS; ++i) {
        base *= 2;
    }
    if (base > MAX_BACKOFF_MS) base = MAX_BACKOFF_MS;

    return std::chrono::milliseconds(static_cast<long long>(static_cast<double>(base) * jitter));
}

std::chrono::milliseconds retry_delay(const RetryPolicy& policy,
                                      int attempt,
                                      const Headers& headers,
                                      double jitter) {
    std::chrono::milliseconds hint(0);
    if (parse_retry_hint(headers, hint)) {
        if (hint.count() > MAX_BACKOFF_MS) {
            hint = std::chrono::milliseconds(MAX_BACKOFF_MS);
        }
        return hint;
    }
    return compute_backoff(policy, attempt, jitter);
}

// =============================================================================
// RetryExecutor
// =============================================================================

RetryExecutor::RetryExecutor(const RetryPolicy& policy,
                             const SleepFn& sleep,
                             const JitterFn& jitter)
    : policy_(policy)
    , sleep_(sleep)
    , jitter_(jitter)
{}

HttpResponse RetryExecutor::execute(const AttemptFn& attempt) const {
    std::mt19937 rng(std::random_device{}());
    std::uniform_real_distribution<double> dist(JITTER_MIN, JITTER_MAX);

    const int max = policy_.max_retries();

    for (int a = 0; ; ++a) {
        double jitter = jitter_ ? jitter_() : dist(rng);
        std::chrono::milliseconds delay(0);

        HttpResponse response;
        bool transport_failed = false;
        try {
            response = attempt(a);
        } catch (const HttpError& e) {
            if (!e.is_transport_failure()) throw;
            if (a >= max) {
                PLOGE << "retry:exhausted attempts=" << (a + 1) << " error=" << sanitize(e.what());
                throw;
            }
            transport_failed = true;
            delay = compute_backoff(policy_, a, jitter);
            PLOGW << "retry:transport_failure attempt=" << a
                  << " delay_ms=" << delay.count() << " error=" << sanitize(e.what());
        }

        if (!transport_failed) {
            if (response.is_success()) {
                if (a > 0) {
                    PLOGI << "retry:recovered attempts=" << (a + 1) << " status=" << response.status;
                }
                return response;
            }

            if (!is_retriable_status(response.status) || a >= max) {
                if (is_retriable_status(response.status)) {
                    PLOGE << "retry:exhausted attempts=" << (a + 1) << " status=" << response.status;
                }
                throw_error_from_response(response.status, response.body);
            }

            delay = retry_delay(policy_, a, response.headers, jitter);
            PLOGW << "retry:retriable_status status=" << response.status
                  << " attempt=" << a << " delay_ms=" << delay.count();
        }

        if (sleep_) {
            sleep_(delay);
        } else if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
    }
}

HttpResponse execute_with_retry(const RetryPolicy& policy, const RetryExecutor::AttemptFn& attempt) {
    return RetryExecutor(policy).execute(attempt);
}

} /* namespace foundry */
