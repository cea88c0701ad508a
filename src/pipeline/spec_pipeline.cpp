/**
 * @file spec_pipeline.cpp
 * @brief Per-model worker pool
 */

#include <pipeline/spec_pipeline.hpp>
#include <core/parameters.hpp>
#include <gate/url.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <atomic>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace MineSpec {

namespace {

std::string model_key(const std::string& brand, const std::string& model) {
    return brand + "/" + model;
}

} // namespace

// =============================================================================
// RunReport
// =============================================================================

void RunReport::merge(const RunReport& other) {
    models += other.models;
    documents += other.documents;
    fetch_failures += other.fetch_failures;
    for (const auto& [reason, count] : other.denials) denials[reason] += count;
    candidates += other.candidates;
    validated += other.validated;
    flagged += other.flagged;
    rejected += other.rejected;
    curves += other.curves;
    failed_keys.insert(failed_keys.end(), other.failed_keys.begin(), other.failed_keys.end());
    cancelled_keys.insert(cancelled_keys.end(), other.cancelled_keys.begin(), other.cancelled_keys.end());
}

size_t RunReport::total_denials() const {
    size_t n = 0;
    for (const auto& [reason, count] : denials) n += count;
    return n;
}

std::string RunReport::summary() const {
    std::ostringstream oss;
    oss << models << " models, " << documents << " documents, " << candidates << " candidates -> "
        << validated << " validated, " << flagged << " flagged, " << rejected << " rejected, "
        << curves << " rimpull curves";
    if (!denials.empty()) {
        oss << "; denied:";
        for (const auto& [reason, count] : denials) oss << " " << to_string(reason) << "=" << count;
    }
    if (fetch_failures) oss << "; fetch failures: " << fetch_failures;
    if (!failed_keys.empty()) oss << "; failed models: " << failed_keys.size();
    if (!cancelled_keys.empty()) oss << "; cancelled models: " << cancelled_keys.size();
    return oss.str();
}

// =============================================================================
// DomainLimiter
// =============================================================================

DomainLimiter::DomainLimiter(int per_domain) : per_domain_(std::max(1, per_domain)) {}

DomainLimiter::Permit& DomainLimiter::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        domain_ = std::move(other.domain_);
        other.owner_ = nullptr;
    }
    return *this;
}

void DomainLimiter::Permit::release() {
    if (owner_) {
        owner_->release(domain_);
        owner_ = nullptr;
    }
}

DomainLimiter::Permit DomainLimiter::acquire(const std::string& domain, const CancellationToken& token) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (in_flight_[domain] >= per_domain_) {
        if (token.cancelled()) return Permit();
        cv_.wait_for(lock, std::chrono::milliseconds(50));
    }
    if (token.cancelled()) return Permit();

    int now = ++in_flight_[domain];
    int& high = peak_[domain];
    high = std::max(high, now);
    return Permit(this, domain);
}

void DomainLimiter::release(const std::string& domain) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = in_flight_.find(domain);
        if (it != in_flight_.end() && it->second > 0) --it->second;
    }
    cv_.notify_all();
}

int DomainLimiter::in_flight(const std::string& domain) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = in_flight_.find(domain);
    return it == in_flight_.end() ? 0 : it->second;
}

int DomainLimiter::peak(const std::string& domain) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peak_.find(domain);
    return it == peak_.end() ? 0 : it->second;
}

// =============================================================================
// SpecPipeline
// =============================================================================

SpecPipeline::SpecPipeline(const Settings& settings, std::shared_ptr<UrlSafetyGate> gate,
                           std::shared_ptr<DocumentFetcher> fetcher, std::shared_ptr<SpecRepository> repository)
    : settings_(settings),
      gate_(std::move(gate)),
      repository_(std::move(repository)),
      extractor_(settings),
      scorer_(settings),
      validator_(settings),
      qa_(settings),
      limiter_(settings.pipeline.per_domain_concurrency) {
    if (!repository_) throw std::invalid_argument("SpecPipeline requires a repository");
    if (fetcher) {
        fetcher_ = std::make_unique<RetryingFetcher>(std::move(fetcher), RetryPolicy::from(settings.pipeline));
    }
}

std::shared_ptr<CancellationToken> SpecPipeline::token_for(const std::string& brand) {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    auto& token = tokens_[brand];
    if (!token) token = std::make_shared<CancellationToken>();
    return token;
}

void SpecPipeline::cancel_brand(const std::string& brand) {
    token_for(brand)->cancel();
    Logger::warn("Cancelled brand " + brand);
}

bool SpecPipeline::brand_cancelled(const std::string& brand) const {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    auto it = tokens_.find(brand);
    return it != tokens_.end() && it->second->cancelled();
}

RunReport SpecPipeline::run(const std::vector<WorkItem>& items) {
    if (!gate_ || !fetcher_) throw std::logic_error("SpecPipeline::run requires a gate and a fetcher");

    std::map<std::pair<std::string, std::string>, ModelJob> grouped;
    for (const auto& item : items) {
        auto& job = grouped[{item.brand, item.model}];
        job.brand = item.brand;
        job.model = item.model;
        for (const auto& url : item.urls) {
            if (std::find(job.urls.begin(), job.urls.end(), url) == job.urls.end()) job.urls.push_back(url);
        }
    }

    std::vector<ModelJob> jobs;
    for (auto& [key, job] : grouped) jobs.push_back(std::move(job));
    return execute(std::move(jobs));
}

RunReport SpecPipeline::ingest(const std::vector<SourcedDocument>& documents) {
    std::map<std::pair<std::string, std::string>, ModelJob> grouped;
    for (const auto& doc : documents) {
        auto& job = grouped[{doc.brand, doc.model}];
        job.brand = doc.brand;
        job.model = doc.model;
        job.documents.push_back(doc.document);
    }

    std::vector<ModelJob> jobs;
    for (auto& [key, job] : grouped) jobs.push_back(std::move(job));
    return execute(std::move(jobs));
}

RunReport SpecPipeline::execute(std::vector<ModelJob> jobs) {
    Timer timer;
    RunReport total;
    std::mutex total_mutex;
    std::atomic<size_t> next{0};

    size_t num_workers = std::min<size_t>(std::max(1, settings_.pipeline.workers), std::max<size_t>(1, jobs.size()));
    Logger::step("Processing " + std::to_string(jobs.size()) + " models with " + std::to_string(num_workers) +
                 " workers");

    auto worker = [&]() {
        RunReport local;
        for (size_t i = next.fetch_add(1); i < jobs.size(); i = next.fetch_add(1)) {
            ModelJob& job = jobs[i];
            try {
                process(job, local);
            } catch (const std::exception& e) {
                Logger::error("Model " + model_key(job.brand, job.model) + " failed: " + e.what());
                local.failed_keys.push_back(model_key(job.brand, job.model) + ": " + e.what());
            }
        }
        std::lock_guard<std::mutex> lock(total_mutex);
        total.merge(local);
    };

    std::vector<std::thread> workers;
    workers.reserve(num_workers);
    for (size_t t = 0; t < num_workers; ++t) workers.emplace_back(worker);
    for (auto& t : workers) t.join();

    std::sort(total.failed_keys.begin(), total.failed_keys.end());
    std::sort(total.cancelled_keys.begin(), total.cancelled_keys.end());

    Logger::success(total.summary() + " in " + std::to_string(static_cast<long long>(timer.elapsed_ms())) + " ms");
    return total;
}

void SpecPipeline::collect(ModelJob& job, const CancellationToken& token, RunReport& report) {
    for (const auto& url : job.urls) {
        if (token.cancelled()) return;

        GateVerdict verdict = gate_->is_safe(url);
        if (!verdict.allowed) {
            report.denials[verdict.reason.value_or(DenyReason::InvalidUrl)]++;
            continue;
        }

        DomainLimiter::Permit permit = limiter_.acquire(url_domain(url), token);
        if (!permit) return;

        FetchOutcome outcome = fetcher_->fetch(url, token);
        permit.release();

        if (outcome.cancelled) return;
        if (!outcome.document) {
            report.fetch_failures++;
            continue;
        }
        if (outcome.document->url.empty()) outcome.document->url = url;
        if (outcome.document->source_domain.empty()) outcome.document->source_domain = url_domain(url);
        job.documents.push_back(std::move(*outcome.document));
    }
}

void SpecPipeline::process(ModelJob& job, RunReport& report) {
    auto token = token_for(job.brand);
    const std::string key = model_key(job.brand, job.model);
    report.models++;

    if (!job.urls.empty()) collect(job, *token, report);

    // Extraction: pure per document
    std::vector<ExtractionCandidate> extracted;
    std::vector<RimpullCurve> curves;
    std::vector<SourceTier> tiers;
    for (const auto& doc : job.documents) {
        if (token->cancelled()) break;
        report.documents++;
        SourceTier tier = classifier_.classify(doc.url, job.brand);
        ExtractionResult result = extractor_.extract(doc, job.brand, job.model);
        for (auto& c : result.candidates) {
            extracted.push_back(std::move(c));
            tiers.push_back(tier);
        }
        for (auto& curve : result.curves) {
            curve.tier = tier;
            curves.push_back(std::move(curve));
        }
    }

    // Stored scores ignore the equipment class: one batch may not show which
    // class the model belongs to. derive() re-scores against the full set.
    std::vector<ScoredCandidate> scored;
    scored.reserve(extracted.size());
    for (size_t i = 0; i < extracted.size(); ++i) scored.push_back(scorer_.score(extracted[i], tiers[i]));
    report.candidates += scored.size();

    if (!scored.empty() || !curves.empty()) {
        repository_->append_candidates(job.brand, job.model, scored, curves);
    }

    if (token->cancelled()) {
        Logger::warn("Skipped reconciliation of " + key + " (brand cancelled)");
        report.cancelled_keys.push_back(key);
        return;
    }

    ModelRecords records = reconcile(job.brand, job.model);
    for (const auto& spec : records.specs) {
        switch (spec.status) {
            case SpecStatus::Validated: report.validated++; break;
            case SpecStatus::Flagged:   report.flagged++;   break;
            case SpecStatus::Rejected:  report.rejected++;  break;
        }
    }
    if (records.curve) report.curves++;
    Logger::info(key + ": " + std::to_string(scored.size()) + " new candidates, " +
                 std::to_string(records.specs.size()) + " records");
}

ModelRecords SpecPipeline::reconcile(const std::string& brand, const std::string& model) {
    return repository_->reconcile_model(brand, model,
                                        [this](const std::vector<ScoredCandidate>& candidates,
                                               const std::vector<RimpullCurve>& curves) {
                                            return derive(candidates, curves);
                                        });
}

ModelRecords SpecPipeline::derive(const std::vector<ScoredCandidate>& candidates,
                                  const std::vector<RimpullCurve>& curves) const {
    ModelRecords records;
    if (candidates.empty() && curves.empty()) return records;

    std::vector<ExtractionCandidate> plain;
    plain.reserve(candidates.size());
    for (const auto& c : candidates) plain.push_back(c.candidate);
    std::string model = !candidates.empty() ? candidates.front().candidate.model : curves.front().model;
    EquipmentClass cls = infer_equipment_class(model, plain);

    std::vector<ScoredCandidate> rescored;
    rescored.reserve(candidates.size());
    for (const auto& c : candidates) rescored.push_back(scorer_.score(c.candidate, c.tier, cls));

    QaReport qa = qa_.check_all(validator_.reconcile(rescored), cls);
    for (auto& r : qa.results) records.specs.push_back(std::move(r.spec));

    std::vector<RimpullCurve> usable;
    for (const auto& curve : curves) {
        CurveCheck check = qa_.check_curve(curve);
        for (const auto& w : check.warnings) Logger::debug(curve.source_url + ": " + w);
        if (check.accepted) usable.push_back(curve);
    }
    records.curve = validator_.reconcile_curves(std::move(usable));

    if (!candidates.empty()) {
        Logger::debug(model + " completeness " + std::to_string(qa.completeness));
    }
    return records;
}

} // namespace MineSpec
