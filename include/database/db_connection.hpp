#ifndef HARVESTER_DB_CONNECTION_HPP
#define HARVESTER_DB_CONNECTION_HPP

#include <string>
#include <memory>
#include <set>
#include <libpq-fe.h>
#include "../utils/config.hpp"

namespace harvester {

class DatabaseConnection {
public:
    explicit DatabaseConnection(const DatabaseSettings& settings);
    ~DatabaseConnection();

    DatabaseConnection(const DatabaseConnection&) = delete;
    DatabaseConnection& operator=(const DatabaseConnection&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    // Re-establishes a connection that was opened once and has since dropped
    bool ensureConnected();

    PGresult* executeQuery(const std::string& query);
    PGresult* executePrepared(const std::string& stmt_name,
                              int n_params,
                              const char* const* param_values);

    bool prepareStatement(const std::string& stmt_name,
                          const std::string& query);
    bool isPrepared(const std::string& stmt_name) const;

    // BEGIN / COMMIT / ROLLBACK on this connection
    bool begin();
    bool commit();
    void rollback();

    std::string escapeIdentifier(const std::string& name) const;

    std::string getLastError() const;

    PGconn* getConnection() const { return conn_; }

private:
    DatabaseSettings settings_;
    PGconn* conn_;
    std::set<std::string> prepared_;
    std::string last_error_;

    void logError(const std::string& context);
};

} // namespace harvester

#endif // HARVESTER_DB_CONNECTION_HPP
