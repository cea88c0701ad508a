/**
 * @file retrying_fetcher.cpp
 * @brief Retry with backoff
 */

#include <pipeline/retrying_fetcher.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <stdexcept>

namespace MineSpec {

std::string to_string(FetchStatus status) {
    switch (status) {
        case FetchStatus::Ok:             return "ok";
        case FetchStatus::Timeout:        return "timeout";
        case FetchStatus::TransientError: return "transient_error";
        case FetchStatus::PermanentError: return "permanent_error";
    }
    return "unknown";
}

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::wait_for(std::chrono::milliseconds delay) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, delay, [this] { return cancelled_.load(); });
}

RetryPolicy RetryPolicy::from(const PipelineSettings& settings) {
    RetryPolicy p;
    p.max_retries = settings.max_retries;
    p.backoff_base = std::chrono::milliseconds(settings.backoff_base_ms);
    p.backoff_cap = std::chrono::milliseconds(settings.backoff_cap_ms);
    p.timeout = std::chrono::seconds(settings.fetch_timeout_seconds);
    return p;
}

RetryingFetcher::RetryingFetcher(std::shared_ptr<DocumentFetcher> fetcher, RetryPolicy policy, uint64_t seed)
    : fetcher_(std::move(fetcher)), policy_(policy), rng_(seed) {
    if (!fetcher_) throw std::invalid_argument("RetryingFetcher requires a fetcher");
}

std::chrono::milliseconds RetryingFetcher::backoff_delay(int attempt) {
    long long base = policy_.backoff_base.count();
    long long cap = policy_.backoff_cap.count();
    long long d = base;
    for (int i = 0; i < attempt && d < cap; ++i) d *= 2;
    d = std::min(d, cap);

    long long half = d / 2;
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_int_distribution<long long> jitter(0, d - half);
    return std::chrono::milliseconds(half + jitter(rng_));
}

FetchOutcome RetryingFetcher::fetch(const std::string& url, const CancellationToken& token) {
    FetchOutcome outcome;

    for (int attempt = 0; attempt <= policy_.max_retries; ++attempt) {
        if (token.cancelled()) {
            outcome.cancelled = true;
            return outcome;
        }

        FetchResult result;
        try {
            result = fetcher_->fetch(url, policy_.timeout);
        } catch (const std::exception& e) {
            result = FetchResult::fail(FetchStatus::TransientError, e.what());
        }
        outcome.attempts = attempt + 1;
        outcome.last_status = result.status;

        if (result.status == FetchStatus::Ok) {
            if (result.document) {
                outcome.document = std::move(result.document);
            } else {
                outcome.last_status = FetchStatus::PermanentError;
            }
            return outcome;
        }
        if (result.status == FetchStatus::PermanentError) {
            Logger::debug("Fetch failed for " + url + ": " + result.detail);
            return outcome;
        }
        if (attempt == policy_.max_retries) {
            Logger::warn("Giving up on " + url + " after " + std::to_string(outcome.attempts) + " attempts (" +
                         to_string(result.status) + ")");
            return outcome;
        }

        if (token.wait_for(backoff_delay(attempt))) {
            outcome.cancelled = true;
            return outcome;
        }
    }
    return outcome;
}

} // namespace MineSpec
