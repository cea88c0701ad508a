/**
 * @file spec_pipeline.hpp
 * @brief Worker pool driving gate, fetch, extraction, scoring, reconciliation and QA per model
 */

#pragma once

#include <config/settings.hpp>
#include <extraction/spec_extractor.hpp>
#include <gate/url_safety_gate.hpp>
#include <pipeline/retrying_fetcher.hpp>
#include <scoring/confidence_scorer.hpp>
#include <scoring/source_classifier.hpp>
#include <storage/spec_repository.hpp>
#include <validation/cross_validator.hpp>
#include <validation/qa_pipeline.hpp>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace MineSpec {

/**
 * @brief URLs to research for one model
 */
struct WorkItem {
    std::string brand;
    std::string model;
    std::vector<std::string> urls;
};

/**
 * @brief Document fetched elsewhere, keyed by the model it was fetched for
 */
struct SourcedDocument {
    std::string brand;
    std::string model;
    RawDocument document;
};

struct RunReport {
    size_t models = 0;
    size_t documents = 0;
    size_t fetch_failures = 0;
    std::map<DenyReason, size_t> denials;
    size_t candidates = 0;
    size_t validated = 0;
    size_t flagged = 0;
    size_t rejected = 0;
    size_t curves = 0;
    std::vector<std::string> failed_keys;    // "brand/model: error"
    std::vector<std::string> cancelled_keys; // "brand/model"

    void merge(const RunReport& other);
    size_t total_denials() const;
    std::string summary() const;
};

/**
 * @brief Bounds in-flight fetches per domain
 */
class DomainLimiter {
public:
    explicit DomainLimiter(int per_domain);

    class Permit {
    public:
        Permit() = default;
        Permit(DomainLimiter* owner, std::string domain) : owner_(owner), domain_(std::move(domain)) {}
        ~Permit() { release(); }

        Permit(Permit&& other) noexcept : owner_(other.owner_), domain_(std::move(other.domain_)) {
            other.owner_ = nullptr;
        }
        Permit& operator=(Permit&& other) noexcept;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        explicit operator bool() const { return owner_ != nullptr; }
        void release();

    private:
        DomainLimiter* owner_ = nullptr;
        std::string domain_;
    };

    /**
     * @brief Block until a slot for the domain is free
     * @return empty permit when the token was cancelled while waiting
     */
    Permit acquire(const std::string& domain, const CancellationToken& token);

    int in_flight(const std::string& domain) const;
    int peak(const std::string& domain) const;

private:
    void release(const std::string& domain);

    int per_domain_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, int> in_flight_;
    std::map<std::string, int> peak_;
};

/**
 * @brief Spec Pipeline
 *
 * Work is grouped by (brand, model). A fixed pool of workers takes one model
 * at a time, collects every document for it, scores and persists the
 * candidates, then reconciles the model through the repository. Different
 * models reconcile independently. A failure is recorded against its model
 * and never stops the others.
 */
class SpecPipeline {
public:
    SpecPipeline(const Settings& settings, std::shared_ptr<UrlSafetyGate> gate,
                 std::shared_ptr<DocumentFetcher> fetcher, std::shared_ptr<SpecRepository> repository);

    /**
     * @brief Gate, fetch and process every URL of every work item
     */
    RunReport run(const std::vector<WorkItem>& items);

    /**
     * @brief Process documents fetched (and gated) by a collaborator
     */
    RunReport ingest(const std::vector<SourcedDocument>& documents);

    /**
     * @brief Stop pending fetches and reconciliation for one brand
     *
     * Models already reconciled stay as they are. Persisted candidates of
     * interrupted models can be reconciled by a later run. Cancellation
     * holds for the lifetime of the pipeline.
     */
    void cancel_brand(const std::string& brand);

    bool brand_cancelled(const std::string& brand) const;

    /**
     * @brief Reconcile one model from its persisted candidates
     *
     * Every stored candidate is scored again with the equipment class inferred
     * from the whole stored set, so records do not depend on how documents
     * were split across runs.
     */
    ModelRecords reconcile(const std::string& brand, const std::string& model);

    const DomainLimiter& limiter() const { return limiter_; }

private:
    struct ModelJob {
        std::string brand;
        std::string model;
        std::vector<std::string> urls;
        std::vector<RawDocument> documents;
    };

    RunReport execute(std::vector<ModelJob> jobs);
    void process(ModelJob& job, RunReport& report);
    void collect(ModelJob& job, const CancellationToken& token, RunReport& report);
    ModelRecords derive(const std::vector<ScoredCandidate>& candidates,
                        const std::vector<RimpullCurve>& curves) const;
    std::shared_ptr<CancellationToken> token_for(const std::string& brand);

    Settings settings_;
    std::shared_ptr<UrlSafetyGate> gate_;
    std::unique_ptr<RetryingFetcher> fetcher_;
    std::shared_ptr<SpecRepository> repository_;

    SpecExtractor extractor_;
    SourceClassifier classifier_;
    ConfidenceScorer scorer_;
    CrossValidator validator_;
    QaPipeline qa_;
    DomainLimiter limiter_;

    mutable std::mutex tokens_mutex_;
    std::map<std::string, std::shared_ptr<CancellationToken>> tokens_;
};

} // namespace MineSpec
