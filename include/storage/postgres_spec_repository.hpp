/**
 * @file postgres_spec_repository.hpp
 * @brief SpecRepository backed by PostgreSQL (schema in sql/schema.sql)
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <storage/spec_repository.hpp>
#include <mutex>
#include <string>

namespace MineSpec {

/**
 * @brief Transactional repository
 *
 * reconcile_model() takes pg_advisory_xact_lock(hashtext('brand/model')) so
 * that workers in any process serialize on one model while different models
 * proceed independently. Candidate ids are stored as 16-byte BYTEA.
 */
class PostgresSpecRepository : public SpecRepository {
public:
    explicit PostgresSpecRepository(const std::string& conninfo = "");
    explicit PostgresSpecRepository(PostgresConnection conn);

    /**
     * @brief Create the schema from a file (idempotent)
     * @throws std::runtime_error when the file cannot be read or the SQL fails
     */
    void apply_schema_file(const std::string& path);

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

    /**
     * @brief Remove every row of one model
     */
    void delete_model(const std::string& brand, const std::string& model);

private:
    std::vector<ScoredCandidate> load_candidates(const std::string& brand, const std::string& model);
    std::vector<RimpullCurve> load_extracted_curves(const std::string& brand, const std::string& model);
    void write_spec(const ValidatedSpec& spec);
    void write_curve(const RimpullCurve& curve);

    std::mutex mutex_; // one session, one statement at a time
    PostgresConnection db_;
};

} // namespace MineSpec
