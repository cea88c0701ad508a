/**
 * @file postgres_spec_repository.cpp
 * @brief PostgreSQL repository
 */

#include <storage/postgres_spec_repository.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <utils/logger.hpp>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace MineSpec {

namespace {

using Param = PostgresConnection::Param;

std::string num(double v) {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
    return oss.str();
}

// Lists travel as newline separated text and become TEXT[] via string_to_array.
std::string join_lines(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += '\n';
        out += items[i];
    }
    return out;
}

std::vector<std::string> split_lines(const std::optional<std::string>& text) {
    std::vector<std::string> out;
    if (!text || text->empty()) return out;
    std::istringstream in(*text);
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

const std::string& required(const PostgresConnection::Row& row, size_t i) {
    if (!row[i]) throw std::runtime_error("Unexpected NULL in column " + std::to_string(i));
    return *row[i];
}

template <typename T>
T parse_enum(const std::optional<T>& parsed, const std::string& raw) {
    if (!parsed) throw std::runtime_error("Unknown enum value in database: " + raw);
    return *parsed;
}

std::string model_lock_key(const std::string& brand, const std::string& model) {
    return brand + "/" + model;
}

} // namespace

PostgresSpecRepository::PostgresSpecRepository(const std::string& conninfo) : db_(conninfo) {}

PostgresSpecRepository::PostgresSpecRepository(PostgresConnection conn) : db_(std::move(conn)) {}

void PostgresSpecRepository::apply_schema_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot read schema file: " + path);
    std::stringstream buffer;
    buffer << in.rdbuf();

    std::lock_guard<std::mutex> lock(mutex_);
    db_.execute_script(buffer.str());
}

void PostgresSpecRepository::append_candidates(const std::string& brand, const std::string& model,
                                               const std::vector<ScoredCandidate>& candidates,
                                               const std::vector<RimpullCurve>& curves) {
    std::lock_guard<std::mutex> lock(mutex_);
    PostgresConnection::Transaction tx(db_);

    for (const auto& sc : candidates) {
        const auto& c = sc.candidate;
        BLAKE3Pipeline::from_hex(c.id); // rejects anything that is not a candidate digest

        Param numeric = c.is_numeric() ? Param(num(c.number())) : std::nullopt;
        Param text = c.is_numeric() ? std::nullopt : Param(c.text());

        db_.execute(R"(INSERT INTO minespec.candidates
            (id, brand, model, parameter, raw_match, value_numeric, value_text, unit, method, source_url,
             span_offset, span_length, span_table, span_row, span_column, confidence, tier)
            VALUES (decode($1, 'hex'), $2, $3, $4, $5, $6::float8, $7, $8, $9, $10,
                    $11::bigint, $12::bigint, $13::int, $14::int, $15::int, $16::float8, $17)
            ON CONFLICT (id) DO NOTHING)",
                    {c.id, brand, model, c.parameter, c.raw_match, numeric, text, c.unit,
                     to_string(c.method), c.source_url, std::to_string(c.span.offset),
                     std::to_string(c.span.length), std::to_string(c.span.table), std::to_string(c.span.row),
                     std::to_string(c.span.column), num(sc.confidence), to_string(sc.tier)});
    }

    for (const auto& curve : curves) {
        db_.execute(R"(INSERT INTO minespec.extracted_curves (brand, model, source_url, tier, violations)
            VALUES ($1, $2, $3, $4, string_to_array($5, E'\n'))
            ON CONFLICT (brand, model, source_url) DO UPDATE SET
                tier = EXCLUDED.tier, violations = EXCLUDED.violations)",
                    {brand, model, curve.source_url, to_string(curve.tier), join_lines(curve.violations)});
        db_.execute("DELETE FROM minespec.extracted_curve_points WHERE brand = $1 AND model = $2 AND source_url = $3",
                    {brand, model, curve.source_url});
        for (size_t i = 0; i < curve.points.size(); ++i) {
            const auto& p = curve.points[i];
            db_.execute(R"(INSERT INTO minespec.extracted_curve_points
                (brand, model, source_url, ordinal, gear, speed_kph, force_kn)
                VALUES ($1, $2, $3, $4::int, $5::int, $6::float8, $7::float8))",
                        {brand, model, curve.source_url, std::to_string(i), std::to_string(p.gear),
                         num(p.speed_kph), num(p.force_kn)});
        }
    }

    tx.commit();
}

std::vector<ScoredCandidate> PostgresSpecRepository::load_candidates(const std::string& brand,
                                                                     const std::string& model) {
    std::vector<ScoredCandidate> out;
    db_.query(R"(SELECT encode(id, 'hex'), parameter, raw_match, value_numeric, value_text, unit, method,
                        source_url, span_offset, span_length, span_table, span_row, span_column,
                        confidence, tier
                 FROM minespec.candidates WHERE brand = $1 AND model = $2 ORDER BY id)",
              {brand, model}, [&](const PostgresConnection::Row& row) {
                  ScoredCandidate sc;
                  auto& c = sc.candidate;
                  c.id = required(row, 0);
                  c.brand = brand;
                  c.model = model;
                  c.parameter = required(row, 1);
                  c.raw_match = required(row, 2);
                  if (row[3]) {
                      c.value = std::stod(*row[3]);
                  } else {
                      c.value = required(row, 4);
                  }
                  c.unit = row[5];
                  c.method = parse_enum(parse_extraction_method(required(row, 6)), required(row, 6));
                  c.source_url = required(row, 7);
                  c.span.offset = std::stoull(required(row, 8));
                  c.span.length = std::stoull(required(row, 9));
                  c.span.table = std::stoi(required(row, 10));
                  c.span.row = std::stoi(required(row, 11));
                  c.span.column = std::stoi(required(row, 12));
                  sc.confidence = std::stod(required(row, 13));
                  sc.tier = parse_enum(parse_source_tier(required(row, 14)), required(row, 14));
                  out.push_back(std::move(sc));
              });
    return out;
}

std::vector<RimpullCurve> PostgresSpecRepository::load_extracted_curves(const std::string& brand,
                                                                        const std::string& model) {
    std::vector<RimpullCurve> curves;
    db_.query(R"(SELECT source_url, tier, array_to_string(violations, E'\n')
                 FROM minespec.extracted_curves WHERE brand = $1 AND model = $2 ORDER BY source_url)",
              {brand, model}, [&](const PostgresConnection::Row& row) {
                  RimpullCurve curve;
                  curve.brand = brand;
                  curve.model = model;
                  curve.source_url = required(row, 0);
                  curve.tier = parse_enum(parse_source_tier(required(row, 1)), required(row, 1));
                  curve.violations = split_lines(row[2]);
                  curves.push_back(std::move(curve));
              });

    for (auto& curve : curves) {
        db_.query(R"(SELECT gear, speed_kph, force_kn FROM minespec.extracted_curve_points
                     WHERE brand = $1 AND model = $2 AND source_url = $3 ORDER BY ordinal)",
                  {brand, model, curve.source_url}, [&](const PostgresConnection::Row& row) {
                      curve.points.push_back(
                          {std::stoi(required(row, 0)), std::stod(required(row, 1)), std::stod(required(row, 2))});
                  });
    }
    return curves;
}

ModelRecords PostgresSpecRepository::reconcile_model(const std::string& brand, const std::string& model,
                                                     const ModelReconciler& reconciler) {
    std::lock_guard<std::mutex> lock(mutex_);
    PostgresConnection::Transaction tx(db_);
    db_.execute("SELECT pg_advisory_xact_lock(hashtext($1))", {model_lock_key(brand, model)});

    auto candidates = load_candidates(brand, model);
    auto curves = load_extracted_curves(brand, model);

    ModelRecords records = reconciler(candidates, curves);
    for (const auto& spec : records.specs) write_spec(spec);
    if (records.curve) write_curve(*records.curve);

    tx.commit();
    Logger::debug("Reconciled " + brand + " " + model + " from " + std::to_string(candidates.size()) +
                  " candidates");
    return records;
}

void PostgresSpecRepository::write_spec(const ValidatedSpec& spec) {
    bool numeric = std::holds_alternative<double>(spec.value);
    Param value_numeric = numeric ? Param(num(std::get<double>(spec.value))) : std::nullopt;
    Param value_text = numeric ? std::nullopt : Param(std::get<std::string>(spec.value));

    db_.execute(R"(INSERT INTO minespec.validated_specs
        (brand, model, parameter, value_numeric, value_text, unit, confidence,
         supporting_candidates, conflicting_candidates, status, reason, updated_at)
        VALUES ($1, $2, $3, $4::float8, $5, $6, $7::float8,
                string_to_array($8, E'\n'), string_to_array($9, E'\n'), $10, $11, now())
        ON CONFLICT (brand, model, parameter) DO UPDATE SET
            value_numeric = EXCLUDED.value_numeric,
            value_text = EXCLUDED.value_text,
            unit = EXCLUDED.unit,
            confidence = EXCLUDED.confidence,
            supporting_candidates = EXCLUDED.supporting_candidates,
            conflicting_candidates = EXCLUDED.conflicting_candidates,
            status = EXCLUDED.status,
            reason = EXCLUDED.reason,
            updated_at = now())",
                {spec.brand, spec.model, spec.parameter, value_numeric, value_text, spec.unit,
                 num(spec.confidence), join_lines(spec.supporting_candidates),
                 join_lines(spec.conflicting_candidates), to_string(spec.status), spec.reason});
}

void PostgresSpecRepository::write_curve(const RimpullCurve& curve) {
    db_.execute(R"(INSERT INTO minespec.rimpull_curves (brand, model, source_url, tier, violations, updated_at)
        VALUES ($1, $2, $3, $4, string_to_array($5, E'\n'), now())
        ON CONFLICT (brand, model) DO UPDATE SET
            source_url = EXCLUDED.source_url,
            tier = EXCLUDED.tier,
            violations = EXCLUDED.violations,
            updated_at = now())",
                {curve.brand, curve.model, curve.source_url, to_string(curve.tier), join_lines(curve.violations)});
    db_.execute("DELETE FROM minespec.rimpull_points WHERE brand = $1 AND model = $2", {curve.brand, curve.model});
    for (size_t i = 0; i < curve.points.size(); ++i) {
        const auto& p = curve.points[i];
        db_.execute(R"(INSERT INTO minespec.rimpull_points (brand, model, ordinal, gear, speed_kph, force_kn)
            VALUES ($1, $2, $3::int, $4::int, $5::float8, $6::float8))",
                    {curve.brand, curve.model, std::to_string(i), std::to_string(p.gear), num(p.speed_kph),
                     num(p.force_kn)});
    }
}

void PostgresSpecRepository::upsert(const ValidatedSpec& spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    PostgresConnection::Transaction tx(db_);
    write_spec(spec);
    tx.commit();
}

void PostgresSpecRepository::upsert(const RimpullCurve& curve) {
    std::lock_guard<std::mutex> lock(mutex_);
    PostgresConnection::Transaction tx(db_);
    write_curve(curve);
    tx.commit();
}

std::vector<ValidatedSpec> PostgresSpecRepository::get_specs(const std::optional<std::string>& brand,
                                                             const std::optional<std::string>& model) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ValidatedSpec> out;
    db_.query(R"(SELECT brand, model, parameter, value_numeric, value_text, unit, confidence,
                        array_to_string(supporting_candidates, E'\n'),
                        array_to_string(conflicting_candidates, E'\n'), status, reason
                 FROM minespec.validated_specs
                 WHERE status <> 'rejected'
                   AND ($1::text IS NULL OR brand = $1)
                   AND ($2::text IS NULL OR model = $2)
                 ORDER BY brand, model, parameter)",
              {brand, model}, [&](const PostgresConnection::Row& row) {
                  ValidatedSpec spec;
                  spec.brand = required(row, 0);
                  spec.model = required(row, 1);
                  spec.parameter = required(row, 2);
                  if (row[3]) {
                      spec.value = std::stod(*row[3]);
                  } else {
                      spec.value = required(row, 4);
                  }
                  spec.unit = row[5];
                  spec.confidence = std::stod(required(row, 6));
                  spec.supporting_candidates = split_lines(row[7]);
                  spec.conflicting_candidates = split_lines(row[8]);
                  spec.status = parse_enum(parse_spec_status(required(row, 9)), required(row, 9));
                  spec.reason = required(row, 10);
                  out.push_back(std::move(spec));
              });
    return out;
}

std::optional<RimpullCurve> PostgresSpecRepository::get_rimpull(const std::string& brand, const std::string& model) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<RimpullCurve> curve;
    db_.query(R"(SELECT source_url, tier, array_to_string(violations, E'\n')
                 FROM minespec.rimpull_curves WHERE brand = $1 AND model = $2)",
              {brand, model}, [&](const PostgresConnection::Row& row) {
                  RimpullCurve c;
                  c.brand = brand;
                  c.model = model;
                  c.source_url = required(row, 0);
                  c.tier = parse_enum(parse_source_tier(required(row, 1)), required(row, 1));
                  c.violations = split_lines(row[2]);
                  curve = std::move(c);
              });
    if (!curve) return std::nullopt;

    db_.query(R"(SELECT gear, speed_kph, force_kn FROM minespec.rimpull_points
                 WHERE brand = $1 AND model = $2 ORDER BY ordinal)",
              {brand, model}, [&](const PostgresConnection::Row& row) {
                  curve->points.push_back(
                      {std::stoi(required(row, 0)), std::stod(required(row, 1)), std::stod(required(row, 2))});
              });
    return curve;
}

void PostgresSpecRepository::delete_model(const std::string& brand, const std::string& model) {
    std::lock_guard<std::mutex> lock(mutex_);
    PostgresConnection::Transaction tx(db_);
    for (const char* table : {"minespec.candidates", "minespec.extracted_curves", "minespec.validated_specs",
                              "minespec.rimpull_curves"}) {
        db_.execute(std::string("DELETE FROM ") + table + " WHERE brand = $1 AND model = $2", {brand, model});
    }
    tx.commit();
}

} // namespace MineSpec
