/**
 * @file retrying_fetcher.hpp
 * @brief Fetch collaborator interface, cancellation and bounded retry
 */

#pragma once

#include <config/settings.hpp>
#include <core/types.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace MineSpec {

enum class FetchStatus {
    Ok,
    Timeout,        // retried
    TransientError, // retried: connection reset, 5xx, 429
    PermanentError  // not retried: 404, unsupported content
};

struct FetchResult {
    FetchStatus status = FetchStatus::PermanentError;
    std::optional<RawDocument> document;
    std::string detail;

    static FetchResult ok(RawDocument doc) { return {FetchStatus::Ok, std::move(doc), {}}; }
    static FetchResult fail(FetchStatus s, std::string detail) { return {s, std::nullopt, std::move(detail)}; }
};

/**
 * @brief Performs one HTTP attempt. Implemented outside the core.
 */
class DocumentFetcher {
public:
    virtual ~DocumentFetcher() = default;
    virtual FetchResult fetch(const std::string& url, std::chrono::seconds timeout) = 0;
};

/**
 * @brief Cooperative cancellation shared by the tasks of one brand
 *
 * Waiting on the token instead of sleeping lets cancel() cut a backoff short.
 */
class CancellationToken {
public:
    void cancel();
    bool cancelled() const { return cancelled_.load(); }

    /**
     * @return true when cancelled before the delay elapsed
     */
    bool wait_for(std::chrono::milliseconds delay) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

struct RetryPolicy {
    int max_retries = 3;
    std::chrono::milliseconds backoff_base{500};
    std::chrono::milliseconds backoff_cap{8000};
    std::chrono::seconds timeout{30};

    static RetryPolicy from(const PipelineSettings& settings);
};

struct FetchOutcome {
    std::optional<RawDocument> document; // nullopt: treat as "no document"
    int attempts = 0;
    FetchStatus last_status = FetchStatus::PermanentError;
    bool cancelled = false;
};

/**
 * @brief Retries timeouts and transient failures with jittered exponential backoff
 *
 * Attempt n (0-based) waits d/2 + U[0, d/2] with d = min(cap, base * 2^n).
 * Exhaustion, permanent failures and cancellation all end in an empty outcome;
 * nothing is thrown to the caller.
 */
class RetryingFetcher {
public:
    RetryingFetcher(std::shared_ptr<DocumentFetcher> fetcher, RetryPolicy policy,
                    uint64_t seed = std::random_device{}());

    FetchOutcome fetch(const std::string& url, const CancellationToken& token);

    std::chrono::milliseconds backoff_delay(int attempt);

    const RetryPolicy& policy() const { return policy_; }

private:
    std::shared_ptr<DocumentFetcher> fetcher_;
    RetryPolicy policy_;
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

std::string to_string(FetchStatus status);

} // namespace MineSpec
