/**
 * @file postgres_connection.hpp
 * @brief libpq connection wrapper
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <libpq-fe.h>

namespace MineSpec {

/**
 * @brief One PostgreSQL session
 *
 * All statements go through PQexecParams in text format. Failures raise
 * std::runtime_error carrying the server message.
 */
class PostgresConnection {
public:
    using Param = std::optional<std::string>;           // nullopt binds SQL NULL
    using Params = std::vector<Param>;
    using Row = std::vector<std::optional<std::string>>; // nullopt for SQL NULL
    using RowCallback = std::function<void(const Row&)>;

    /**
     * @brief Connect using the libpq environment
     *
     * Uses: PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD
     * Defaults: localhost, 5432, minespec, postgres, (no password)
     */
    PostgresConnection();

    /**
     * @brief Connect with an explicit connection string; empty selects the environment
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection();

    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    PostgresConnection(PostgresConnection&& other) noexcept;
    PostgresConnection& operator=(PostgresConnection&& other) noexcept;

    bool is_connected() const;

    void execute(const std::string& sql, const Params& params = {});

    /**
     * @brief Run several semicolon separated statements without parameters
     */
    void execute_script(const std::string& sql);

    /**
     * @brief First column of the first row, nullopt for no rows or NULL
     */
    std::optional<std::string> query_single(const std::string& sql,
                                            const Params& params = {});

    void query(const std::string& sql, const Params& params, const RowCallback& callback);

    void begin();
    void commit();
    void rollback();

    /**
     * @brief RAII transaction guard, rolls back unless committed
     */
    class Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();
        void rollback();

    private:
        PostgresConnection& conn_;
        bool done_ = false;
    };

    std::string last_error() const;

private:
    struct ResultDeleter {
        void operator()(PGresult* r) const { PQclear(r); }
    };
    using ResultPtr = std::unique_ptr<PGresult, ResultDeleter>;

    static std::string environment_conninfo();

    void connect(const std::string& conninfo);
    void disconnect();
    ResultPtr run(const std::string& sql, const Params& params);
    ResultPtr check(ResultPtr result);

    PGconn* conn_ = nullptr;
    std::string last_error_;
};

} // namespace MineSpec
