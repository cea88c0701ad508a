/**
 * @file reconcile_documents.cpp
 * @brief Reconcile a YAML bundle of pre-fetched documents
 *
 * Bundle layout:
 *
 *   documents:
 *     - brand: Caterpillar
 *       model: "797F"
 *       url: https://www.cat.com/en_US/products/new/equipment/off-highway-trucks/797f.html
 *       content_type: html          # html | pdf
 *       text: "Operating weight 623 690 kg ..."
 *       tables:
 *         - - ["Gross machine operating weight", "623 690 kg"]
 *           - ["Engine model", "Cat C175-20"]
 */

#include <config/settings.hpp>
#include <gate/url.hpp>
#include <pipeline/spec_pipeline.hpp>
#include <report/json_report.hpp>
#include <storage/postgres_spec_repository.hpp>
#include <storage/spec_repository.hpp>
#include <utils/logger.hpp>
#include <yaml-cpp/yaml.h>
#include <iomanip>
#include <iostream>
#include <set>
#include <stdexcept>

using namespace MineSpec;

namespace {

std::vector<SourcedDocument> load_bundle(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Cannot load bundle " + path + ": " + e.what());
    }

    const YAML::Node docs = root["documents"];
    if (!docs || !docs.IsSequence()) {
        throw std::runtime_error(path + ": expected a 'documents' sequence");
    }

    std::vector<SourcedDocument> out;
    for (size_t i = 0; i < docs.size(); ++i) {
        const YAML::Node& node = docs[i];
        const std::string where = path + ": documents[" + std::to_string(i) + "]";
        for (const char* field : {"brand", "model", "url"}) {
            if (!node[field] || !node[field].IsScalar()) throw std::runtime_error(where + ": missing " + field);
        }

        SourcedDocument sd;
        sd.brand = node["brand"].as<std::string>();
        sd.model = node["model"].as<std::string>();

        RawDocument& doc = sd.document;
        doc.url = node["url"].as<std::string>();
        doc.source_domain = url_domain(doc.url);
        doc.fetched_at = std::chrono::system_clock::now();
        if (node["content_type"]) {
            auto type = parse_content_type(node["content_type"].as<std::string>());
            if (!type) throw std::runtime_error(where + ": content_type must be html or pdf");
            doc.content_type = *type;
        }
        if (node["text"]) doc.text = node["text"].as<std::string>();
        if (node["tables"]) {
            for (const auto& table_node : node["tables"]) {
                Table table;
                for (const auto& row_node : table_node) {
                    std::vector<std::string> row;
                    for (const auto& cell : row_node) row.push_back(cell.as<std::string>());
                    table.push_back(std::move(row));
                }
                doc.tables.push_back(std::move(table));
            }
        }
        out.push_back(std::move(sd));
    }
    return out;
}

void print_spec(const ValidatedSpec& spec) {
    std::cout << "  " << std::left << std::setw(10) << to_string(spec.status) << std::setw(24) << spec.parameter
              << format_value(spec.value);
    if (spec.unit) std::cout << " " << *spec.unit;
    std::cout << "  (confidence " << spec.confidence << ", " << spec.supporting_candidates.size() << " supporting";
    if (!spec.conflicting_candidates.empty()) {
        std::cout << ", " << spec.conflicting_candidates.size() << " conflicting";
    }
    std::cout << ")";
    if (!spec.reason.empty()) std::cout << "  " << spec.reason;
    std::cout << "\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string bundle_path;
    std::string config_path;
    std::string schema_path;
    bool use_db = false;
    bool as_json = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--schema" && i + 1 < argc) {
            schema_path = argv[++i];
        } else if (arg == "--db") {
            use_db = true;
        } else if (arg == "--json") {
            as_json = true;
        } else if (bundle_path.empty()) {
            bundle_path = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return 1;
        }
    }

    if (bundle_path.empty()) {
        std::cerr << "Usage: " << argv[0] << " <bundle.yaml> [--config settings.yaml] [--db] [--schema schema.sql] [--json]\n";
        std::cerr << "\n  --db       persist through PostgreSQL (database.conninfo or PG* environment)\n";
        std::cerr << "  --schema   create the schema before ingesting (with --db)\n";
        std::cerr << "  --json     print records and the run report as JSON\n";
        return 1;
    }

    try {
        Settings settings = config_path.empty() ? Settings::defaults() : Settings::load_file(config_path);
        Logger::set_level(Logger::parse_level(settings.log_level));
        // stdout carries the JSON document; progress lines would corrupt it
        if (as_json && Logger::level() < Logger::Level::Warning) Logger::set_level(Logger::Level::Warning);

        auto documents = load_bundle(bundle_path);
        Logger::info("Loaded " + std::to_string(documents.size()) + " documents from " + bundle_path);

        std::shared_ptr<SpecRepository> repository;
        if (use_db) {
            auto pg = std::make_shared<PostgresSpecRepository>(settings.database_conninfo);
            if (!schema_path.empty()) pg->apply_schema_file(schema_path);
            repository = pg;
        } else {
            repository = std::make_shared<InMemorySpecRepository>();
        }

        // Documents in a bundle were fetched elsewhere; no gate or fetcher is needed.
        SpecPipeline pipeline(settings, nullptr, nullptr, repository);
        RunReport report = pipeline.ingest(documents);

        std::set<std::pair<std::string, std::string>> models;
        for (const auto& d : documents) models.insert({d.brand, d.model});

        if (as_json) {
            nlohmann::json out;
            out["models"] = nlohmann::json::array();
            for (const auto& [brand, model] : models) {
                out["models"].push_back(
                    model_to_json(brand, model, repository->get_specs(brand, model), repository->get_rimpull(brand, model)));
            }
            out["report"] = to_json(report);
            std::cout << out.dump(2) << "\n";
            return report.failed_keys.empty() ? 0 : 2;
        }

        for (const auto& [brand, model] : models) {
            std::cout << "\n" << brand << " " << model << "\n";
            for (const auto& spec : repository->get_specs(brand, model)) print_spec(spec);
            if (auto curve = repository->get_rimpull(brand, model)) {
                std::cout << "  rimpull: " << curve->points.size() << " points, max " << curve->max_force_kn()
                          << " kN from " << curve->source_url;
                if (!curve->monotonic()) std::cout << " (" << curve->violations.size() << " violations)";
                std::cout << "\n";
            }
        }

        std::cout << "\n" << report.summary() << "\n";
        return report.failed_keys.empty() ? 0 : 2;
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
