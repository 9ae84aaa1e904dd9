#ifndef FOUNDRY_RETRY_HPP
#define FOUNDRY_RETRY_HPP

#include "types.hpp"

#include <chrono>
#include <functional>

namespace foundry {

// =============================================================================
// Limits
// =============================================================================

/** Largest accepted RetryPolicy::max_retries(). */
static const int MAX_RETRIES_LIMIT = 10;

/** Ceiling for any single backoff delay and for initial_backoff. */
static const long long MAX_BACKOFF_MS = 60000;

static const int DEFAULT_MAX_RETRIES = 3;
static const long long DEFAULT_INITIAL_BACKOFF_MS = 500;

/** Multiplicative jitter bounds applied to computed backoff. */
static const double JITTER_MIN = 0.75;
static const double JITTER_MAX = 1.25;

// =============================================================================
// RetryPolicy
// =============================================================================

/**
 * Bounded retry configuration. Always valid once constructed.
 *
 * Example:
 *   foundry::RetryPolicy p = foundry::RetryPolicy::create(
 *       3, std::chrono::milliseconds(100));
 */
class RetryPolicy {
public:
    /** 3 retries, 500ms initial backoff. */
    RetryPolicy();

    /**
     * @throws ConfigurationError if max_retries is outside [0, 10] or
     *         initial_backoff is negative or above MAX_BACKOFF_MS.
     */
    static RetryPolicy create(int max_retries, std::chrono::milliseconds initial_backoff);

    /** A policy that makes exactly one attempt. */
    static RetryPolicy none();

    int max_retries() const { return max_retries_; }
    std::chrono::milliseconds initial_backoff() const { return initial_backoff_; }

private:
    RetryPolicy(int max_retries, std::chrono::milliseconds initial_backoff);

    int max_retries_;
    std::chrono::milliseconds initial_backoff_;
};

// =============================================================================
// Delay computation
// =============================================================================

/** 429, 502, 503 and 504. */
bool is_retriable_status(int status);

/**
 * Read a server retry hint: "retry-after-ms" (milliseconds) first, then
 * "retry-after" (seconds). Both must be non-negative integers; anything
 * else counts as no hint.
 *
 * @return true and set delay when a usable hint is present.
 */
bool parse_retry_hint(const Headers& headers, std::chrono::milliseconds& delay);

/**
 * initial_backoff * 2^attempt, capped at MAX_BACKOFF_MS, then multiplied
 * by jitter (expected in [JITTER_MIN, JITTER_MAX]).
 */
std::chrono::milliseconds compute_backoff(const RetryPolicy& policy,
                                          int attempt,
                                          double jitter);

/**
 * Delay before the attempt following a retriable response: the server hint
 * capped at MAX_BACKOFF_MS when present, compute_backoff() otherwise.
 */
std::chrono::milliseconds retry_delay(const RetryPolicy& policy,
                                      int attempt,
                                      const Headers& headers,
                                      double jitter);

// =============================================================================
// RetryExecutor
// =============================================================================

/**
 * The single attempt loop shared by every request shape.
 *
 * The attempt function is invoked once per attempt with the attempt index
 * (0-based) and must do all per-attempt work itself, including resolving
 * the credential. It reports a transport failure by throwing HttpError
 * with status_code() == 0; that is retried like a retriable status. Any
 * other exception ends the loop immediately.
 *
 * Attempts are strictly sequential; the executor holds no state between
 * execute() calls and starts no threads.
 */
class RetryExecutor {
public:
    typedef std::function<HttpResponse(int attempt)> AttemptFn;
    typedef std::function<void(std::chrono::milliseconds)> SleepFn;
    typedef std::function<double()> JitterFn;

    /**
     * sleep defaults to std::this_thread::sleep_for, jitter to a uniform
     * draw in [JITTER_MIN, JITTER_MAX].
     */
    explicit RetryExecutor(const RetryPolicy& policy = RetryPolicy(),
                           const SleepFn& sleep = SleepFn(),
                           const JitterFn& jitter = JitterFn());

    /**
     * Run attempts until success, a terminal status, or retries run out.
     *
     * @return the first successful response.
     * @throws ApiError / HttpError built from the terminal response, the
     *         last transport HttpError, or whatever the attempt threw.
     */
    HttpResponse execute(const AttemptFn& attempt) const;

    const RetryPolicy& policy() const { return policy_; }

private:
    RetryPolicy policy_;
    SleepFn sleep_;
    JitterFn jitter_;
};

/** execute() on a default-configured RetryExecutor. */
HttpResponse execute_with_retry(const RetryPolicy& policy,
                                const RetryExecutor::AttemptFn& attempt);

} // namespace foundry

#endif // FOUNDRY_RETRY_HPP
