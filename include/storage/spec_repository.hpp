/**
 * @file spec_repository.hpp
 * @brief Persistence surface for candidates, reconciled records and rimpull curves
 */

#pragma once

#include <core/types.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace MineSpec {

/**
 * @brief Everything derived for one (brand, model) in one reconciliation
 */
struct ModelRecords {
    std::vector<ValidatedSpec> specs;
    std::optional<RimpullCurve> curve;
};

/**
 * @brief Derives the records of one model from its full candidate set
 */
using ModelReconciler = std::function<ModelRecords(const std::vector<ScoredCandidate>&,
                                                   const std::vector<RimpullCurve>&)>;

/**
 * @brief Repository interface
 *
 * Candidates are append-only and keyed by id, so appending the same candidate
 * twice is harmless. reconcile_model() re-reads every candidate of the model
 * and rebuilds its records from scratch while holding an exclusive per-model
 * lock. Readers never see rejected records.
 */
class SpecRepository {
public:
    virtual ~SpecRepository() = default;

    virtual void append_candidates(const std::string& brand, const std::string& model,
                                   const std::vector<ScoredCandidate>& candidates,
                                   const std::vector<RimpullCurve>& curves) = 0;

    virtual ModelRecords reconcile_model(const std::string& brand, const std::string& model,
                                         const ModelReconciler& reconciler) = 0;

    virtual void upsert(const ValidatedSpec& spec) = 0;
    virtual void upsert(const RimpullCurve& curve) = 0;

    /**
     * @brief Validated and flagged records, ordered by brand, model, parameter
     */
    virtual std::vector<ValidatedSpec> get_specs(const std::optional<std::string>& brand = std::nullopt,
                                                 const std::optional<std::string>& model = std::nullopt) = 0;

    virtual std::optional<RimpullCurve> get_rimpull(const std::string& brand, const std::string& model) = 0;
};

/**
 * @brief Process-local repository for tests and dry runs
 */
class InMemorySpecRepository : public SpecRepository {
public:
    void append_candidates(const std::string& brand, const std::string& model,
                           const std::vector<ScoredCandidate>& candidates,
                           const std::vector<RimpullCurve>& curves) override;

    ModelRecords reconcile_model(const std::string& brand, const std::string& model,
                                 const ModelReconciler& reconciler) override;

    void upsert(const ValidatedSpec& spec) override;
    void upsert(const RimpullCurve& curve) override;

    std::vector<ValidatedSpec> get_specs(const std::optional<std::string>& brand = std::nullopt,
                                         const std::optional<std::string>& model = std::nullopt) override;

    std::optional<RimpullCurve> get_rimpull(const std::string& brand, const std::string& model) override;

    size_t candidate_count(const std::string& brand, const std::string& model) const;

    /**
     * @brief Stored record including rejected ones
     */
    std::optional<ValidatedSpec> find(const SpecKey& key) const;

private:
    using ModelKey = std::pair<std::string, std::string>;

    std::mutex& model_lock(const ModelKey& key);

    mutable std::mutex mutex_;
    std::map<ModelKey, std::map<std::string, ScoredCandidate>> candidates_;
    std::map<ModelKey, std::map<std::string, RimpullCurve>> extracted_curves_; // by source url
    std::map<SpecKey, ValidatedSpec> specs_;
    std::map<ModelKey, RimpullCurve> curves_;
    std::map<ModelKey, std::unique_ptr<std::mutex>> model_locks_;
};

} // namespace MineSpec
