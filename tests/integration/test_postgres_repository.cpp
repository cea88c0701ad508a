/**
 * @file test_postgres_repository.cpp
 * @brief PostgreSQL repository against a live database (skipped when none is reachable)
 *
 * Connection parameters come from PGHOST, PGPORT, PGDATABASE, PGUSER and
 * PGPASSWORD.
 */

#include <gtest/gtest.h>
#include <config/settings.hpp>
#include <pipeline/spec_pipeline.hpp>
#include <storage/postgres_spec_repository.hpp>
#include <validation/cross_validator.hpp>
#include <algorithm>
#include <memory>
#include <thread>

using namespace MineSpec;

namespace {

const std::string BRAND = "MineSpec Integration";
const std::string MODEL = "IT-100";

ScoredCandidate candidate(const std::string& url, const std::string& parameter, SpecValue value,
                          std::optional<std::string> unit, double confidence, size_t offset) {
    ScoredCandidate s;
    auto& c = s.candidate;
    c.brand = BRAND;
    c.model = MODEL;
    c.parameter = parameter;
    c.value = std::move(value);
    c.unit = std::move(unit);
    c.method = ExtractionMethod::Regex;
    c.source_url = url;
    c.raw_match = parameter + " " + format_value(c.value);
    c.span.offset = offset;
    c.span.length = c.raw_match.size();
    c.id = make_candidate_id(c.source_url, c.method, c.parameter, c.span, c.raw_match);
    s.confidence = confidence;
    s.tier = SourceTier::OemPrimary;
    return s;
}

class PostgresRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        try {
            repository = std::make_shared<PostgresSpecRepository>();
        } catch (const std::runtime_error& e) {
            GTEST_SKIP() << "PostgreSQL not reachable: " << e.what();
        }
        repository->apply_schema_file(MINESPEC_SCHEMA_PATH);
        repository->delete_model(BRAND, MODEL);
    }

    void TearDown() override {
        if (repository) repository->delete_model(BRAND, MODEL);
    }

    ModelReconciler reconciler() {
        return [this](const std::vector<ScoredCandidate>& candidates, const std::vector<RimpullCurve>& curves) {
            ModelRecords records;
            records.specs = validator.reconcile(candidates);
            records.curve = validator.reconcile_curves(curves);
            return records;
        };
    }

    Settings settings = Settings::defaults();
    CrossValidator validator{settings};
    std::shared_ptr<PostgresSpecRepository> repository;
};

} // namespace

// =============================================================================
// Candidates and reconciliation
// =============================================================================

TEST_F(PostgresRepositoryTest, AppendAndReconcile) {
    std::vector<ScoredCandidate> batch = {
        candidate("https://www.cat.com/a", "operating_weight_kg", 180000.0, std::string("kg"), 0.9, 0),
        candidate("https://www.cat.com/b", "operating_weight_kg", 182000.0, std::string("kg"), 0.85, 0),
        candidate("https://www.cat.com/a", "engine_model", std::string("Cat C175-16"), std::nullopt, 0.9, 40),
    };
    repository->append_candidates(BRAND, MODEL, batch, {});

    ModelRecords records = repository->reconcile_model(BRAND, MODEL, reconciler());
    ASSERT_EQ(records.specs.size(), 2u);

    auto stored = repository->get_specs(BRAND, MODEL);
    ASSERT_EQ(stored.size(), 2u);
    EXPECT_EQ(stored[0].parameter, "engine_model");
    EXPECT_EQ(std::get<std::string>(stored[0].value), "Cat C175-16");
    EXPECT_FALSE(stored[0].unit.has_value());

    EXPECT_EQ(stored[1].parameter, "operating_weight_kg");
    EXPECT_EQ(stored[1].status, SpecStatus::Validated);
    EXPECT_EQ(stored[1].unit.value_or(""), "kg");
    EXPECT_EQ(stored[1], records.specs[1]);
    EXPECT_EQ(stored[1].supporting_candidates.size(), 2u);
}

TEST_F(PostgresRepositoryTest, AppendIsIdempotent) {
    std::vector<ScoredCandidate> batch = {
        candidate("https://www.cat.com/a", "engine_power_kw", 2610.0, std::string("kW"), 0.9, 0),
    };
    repository->append_candidates(BRAND, MODEL, batch, {});
    repository->append_candidates(BRAND, MODEL, batch, {});

    ModelRecords records = repository->reconcile_model(BRAND, MODEL, reconciler());
    ASSERT_EQ(records.specs.size(), 1u);
    EXPECT_EQ(records.specs[0].supporting_candidates.size(), 1u);
}

TEST_F(PostgresRepositoryTest, MalformedIdRejected) {
    auto bad = candidate("https://www.cat.com/a", "engine_power_kw", 2610.0, std::string("kW"), 0.9, 0);
    bad.candidate.id = "not-hex";
    EXPECT_THROW(repository->append_candidates(BRAND, MODEL, {bad}, {}), std::invalid_argument);
}

TEST_F(PostgresRepositoryTest, ConcurrentReconcileConverges) {
    std::vector<ScoredCandidate> batch;
    for (size_t i = 0; i < 8; ++i) {
        batch.push_back(candidate("https://www.cat.com/p" + std::to_string(i), "engine_power_kw",
                                  2600.0 + static_cast<double>(i), std::string("kW"), 0.8, i));
    }
    repository->append_candidates(BRAND, MODEL, batch, {});

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([this] { repository->reconcile_model(BRAND, MODEL, reconciler()); });
    }
    for (auto& w : workers) w.join();

    auto stored = repository->get_specs(BRAND, MODEL);
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].supporting_candidates.size(), 8u);
}

// =============================================================================
// Records and curves
// =============================================================================

TEST_F(PostgresRepositoryTest, RejectedRecordsHidden) {
    ValidatedSpec spec;
    spec.brand = BRAND;
    spec.model = MODEL;
    spec.parameter = "empty_weight_kg";
    spec.value = 300000.0;
    spec.unit = "kg";
    spec.confidence = 0.9;
    spec.status = SpecStatus::Rejected;
    spec.reason = "empty weight not below operating weight";
    repository->upsert(spec);
    EXPECT_TRUE(repository->get_specs(BRAND, MODEL).empty());

    spec.status = SpecStatus::Flagged;
    repository->upsert(spec);
    auto stored = repository->get_specs(BRAND, MODEL);
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].status, SpecStatus::Flagged);
    EXPECT_EQ(stored[0].reason, spec.reason);
}

TEST_F(PostgresRepositoryTest, RimpullCurveRoundTrip) {
    RimpullCurve curve;
    curve.brand = BRAND;
    curve.model = MODEL;
    curve.source_url = "https://www.cat.com/it-100.pdf";
    curve.tier = SourceTier::OemPrimary;
    curve.points = {{-1, 3.4, 1050.0}, {1, 3.5, 1100.0}, {2, 7.2, 620.0}};
    curve.violations = {"gear 2: force rises"};

    repository->append_candidates(BRAND, MODEL, {}, {curve});
    ModelRecords records = repository->reconcile_model(BRAND, MODEL, reconciler());
    ASSERT_TRUE(records.curve.has_value());

    auto stored = repository->get_rimpull(BRAND, MODEL);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->points, curve.points);
    EXPECT_EQ(stored->violations, curve.violations);
    EXPECT_EQ(stored->tier, SourceTier::OemPrimary);
    EXPECT_EQ(stored->source_url, curve.source_url);

    EXPECT_FALSE(repository->get_rimpull(BRAND, "no-such-model").has_value());
}

TEST_F(PostgresRepositoryTest, PipelineIngest) {
    RawDocument doc;
    doc.url = "https://www.cat.com/it-100";
    doc.tables = {{{"Engine Power (kW)", "2 610"}, {"Fuel tank (L)", "4 542"}}};

    SpecPipeline pipeline(settings, nullptr, nullptr, repository);
    RunReport report = pipeline.ingest({{BRAND, MODEL, doc}});
    EXPECT_TRUE(report.failed_keys.empty());
    EXPECT_EQ(report.validated, 2u);

    auto stored = repository->get_specs(BRAND, MODEL);
    ASSERT_EQ(stored.size(), 2u);
    EXPECT_DOUBLE_EQ(std::get<double>(stored[0].value), 2610.0);
}
