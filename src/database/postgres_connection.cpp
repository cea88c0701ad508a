/**
 * @file postgres_connection.cpp
 * @brief libpq connection implementation
 */

#include <database/postgres_connection.hpp>
#include <utils/logger.hpp>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace MineSpec {

std::string PostgresConnection::environment_conninfo() {
    auto env = [](const char* name, const char* fallback) {
        const char* v = std::getenv(name);
        return std::string(v ? v : fallback);
    };

    std::ostringstream conninfo;
    conninfo << "host=" << env("PGHOST", "localhost")
             << " port=" << env("PGPORT", "5432")
             << " dbname=" << env("PGDATABASE", "minespec")
             << " user=" << env("PGUSER", "postgres");
    if (const char* password = std::getenv("PGPASSWORD")) {
        conninfo << " password=" << password;
    }
    conninfo << " connect_timeout=5";
    return conninfo.str();
}

PostgresConnection::PostgresConnection() {
    connect(environment_conninfo());
}

PostgresConnection::PostgresConnection(const std::string& conninfo) {
    connect(conninfo.empty() ? environment_conninfo() : conninfo);
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

PostgresConnection::PostgresConnection(PostgresConnection&& other) noexcept
    : conn_(other.conn_), last_error_(std::move(other.last_error_)) {
    other.conn_ = nullptr;
}

PostgresConnection& PostgresConnection::operator=(PostgresConnection&& other) noexcept {
    if (this != &other) {
        disconnect();
        conn_ = other.conn_;
        last_error_ = std::move(other.last_error_);
        other.conn_ = nullptr;
    }
    return *this;
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw std::runtime_error("PostgreSQL connection failed: " + last_error_);
    }
}

void PostgresConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

PostgresConnection::ResultPtr PostgresConnection::check(ResultPtr result) {
    ExecStatusType status = result ? PQresultStatus(result.get()) : PGRES_FATAL_ERROR;
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        last_error_ = PQerrorMessage(conn_);
        throw std::runtime_error("PostgreSQL query failed: " + last_error_);
    }
    return result;
}

PostgresConnection::ResultPtr PostgresConnection::run(const std::string& sql, const Params& params) {
    if (!is_connected()) {
        throw std::runtime_error("Not connected to database");
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) values.push_back(p ? p->c_str() : nullptr);

    return check(ResultPtr(PQexecParams(conn_, sql.c_str(), static_cast<int>(params.size()), nullptr,
                                        values.empty() ? nullptr : values.data(), nullptr, nullptr, 0)));
}

void PostgresConnection::execute(const std::string& sql, const Params& params) {
    run(sql, params);
}

void PostgresConnection::execute_script(const std::string& sql) {
    if (!is_connected()) {
        throw std::runtime_error("Not connected to database");
    }
    check(ResultPtr(PQexec(conn_, sql.c_str())));
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql, const Params& params) {
    auto result = run(sql, params);
    if (PQntuples(result.get()) == 0 || PQnfields(result.get()) == 0) return std::nullopt;
    if (PQgetisnull(result.get(), 0, 0)) return std::nullopt;
    return std::string(PQgetvalue(result.get(), 0, 0));
}

void PostgresConnection::query(const std::string& sql, const Params& params, const RowCallback& callback) {
    auto result = run(sql, params);

    int nrows = PQntuples(result.get());
    int nfields = PQnfields(result.get());

    Row row;
    for (int i = 0; i < nrows; ++i) {
        row.clear();
        row.reserve(nfields);
        for (int j = 0; j < nfields; ++j) {
            if (PQgetisnull(result.get(), i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(result.get(), i, j)));
            }
        }
        callback(row);
    }
}

void PostgresConnection::begin() {
    execute("BEGIN");
}

void PostgresConnection::commit() {
    execute("COMMIT");
}

void PostgresConnection::rollback() {
    execute("ROLLBACK");
}

std::string PostgresConnection::last_error() const {
    return last_error_;
}

PostgresConnection::Transaction::Transaction(PostgresConnection& conn) : conn_(conn) {
    conn_.begin();
}

PostgresConnection::Transaction::~Transaction() {
    if (done_) return;
    try {
        conn_.rollback();
    } catch (const std::exception& e) {
        Logger::warn(std::string("Rollback failed: ") + e.what());
    }
}

void PostgresConnection::Transaction::commit() {
    conn_.commit();
    done_ = true;
}

void PostgresConnection::Transaction::rollback() {
    conn_.rollback();
    done_ = true;
}

} // namespace MineSpec
