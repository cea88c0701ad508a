/**
 * @file spec_repository.cpp
 * @brief In-memory repository
 */

#include <storage/spec_repository.hpp>

namespace MineSpec {

void InMemorySpecRepository::append_candidates(const std::string& brand, const std::string& model,
                                               const std::vector<ScoredCandidate>& candidates,
                                               const std::vector<RimpullCurve>& curves) {
    std::lock_guard<std::mutex> lock(mutex_);
    ModelKey key{brand, model};
    auto& stored = candidates_[key];
    for (const auto& c : candidates) stored.emplace(c.candidate.id, c);
    auto& stored_curves = extracted_curves_[key];
    for (const auto& curve : curves) stored_curves[curve.source_url] = curve;
}

std::mutex& InMemorySpecRepository::model_lock(const ModelKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = model_locks_[key];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

ModelRecords InMemorySpecRepository::reconcile_model(const std::string& brand, const std::string& model,
                                                     const ModelReconciler& reconciler) {
    ModelKey key{brand, model};
    std::lock_guard<std::mutex> model_guard(model_lock(key));

    std::vector<ScoredCandidate> candidates;
    std::vector<RimpullCurve> curves;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto c = candidates_.find(key);
        if (c != candidates_.end()) {
            for (const auto& [id, sc] : c->second) candidates.push_back(sc);
        }
        auto r = extracted_curves_.find(key);
        if (r != extracted_curves_.end()) {
            for (const auto& [url, curve] : r->second) curves.push_back(curve);
        }
    }

    ModelRecords records = reconciler(candidates, curves);
    for (const auto& spec : records.specs) upsert(spec);
    if (records.curve) upsert(*records.curve);
    return records;
}

void InMemorySpecRepository::upsert(const ValidatedSpec& spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    specs_[spec.key()] = spec;
}

void InMemorySpecRepository::upsert(const RimpullCurve& curve) {
    std::lock_guard<std::mutex> lock(mutex_);
    curves_[{curve.brand, curve.model}] = curve;
}

std::vector<ValidatedSpec> InMemorySpecRepository::get_specs(const std::optional<std::string>& brand,
                                                             const std::optional<std::string>& model) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ValidatedSpec> out;
    for (const auto& [key, spec] : specs_) {
        if (brand && key.brand != *brand) continue;
        if (model && key.model != *model) continue;
        if (spec.status == SpecStatus::Rejected) continue;
        out.push_back(spec);
    }
    return out;
}

std::optional<RimpullCurve> InMemorySpecRepository::get_rimpull(const std::string& brand, const std::string& model) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = curves_.find({brand, model});
    if (it == curves_.end()) return std::nullopt;
    return it->second;
}

size_t InMemorySpecRepository::candidate_count(const std::string& brand, const std::string& model) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = candidates_.find({brand, model});
    return it == candidates_.end() ? 0 : it->second.size();
}

std::optional<ValidatedSpec> InMemorySpecRepository::find(const SpecKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = specs_.find(key);
    if (it == specs_.end()) return std::nullopt;
    return it->second;
}

} // namespace MineSpec
