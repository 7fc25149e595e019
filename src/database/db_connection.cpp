#include "../../include/database/db_connection.hpp"
#include "../../include/utils/logger.hpp"
#include <cstring>
#include <vector>

namespace harvester {

DatabaseConnection::DatabaseConnection(const DatabaseSettings& settings)
    : settings_(settings), conn_(nullptr) {
}

DatabaseConnection::~DatabaseConnection() {
    disconnect();
}

bool DatabaseConnection::connect() {
    disconnect();

    const char* keywords[] = {"host", "port", "dbname", "user", "password", "application_name", nullptr};
    const char* values[] = {settings_.host.c_str(), settings_.port.c_str(), settings_.name.c_str(),
                            settings_.user.c_str(), settings_.password.c_str(), "harvester", nullptr};
    conn_ = PQconnectdbParams(keywords, values, 0);

    if (PQstatus(conn_) != CONNECTION_OK) {
        logError("connect to " + settings_.host + ":" + settings_.port + "/" + settings_.name);
        return false;
    }

    Logger::getInstance().debug("Connected to PostgreSQL database " + settings_.name);
    return true;
}

void DatabaseConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
    prepared_.clear();
}

bool DatabaseConnection::isConnected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool DatabaseConnection::ensureConnected() {
    if (conn_ == nullptr) {
        return false;
    }
    if (PQstatus(conn_) == CONNECTION_OK) {
        return true;
    }
    Logger::getInstance().warning("PostgreSQL connection lost, resetting");
    PQreset(conn_);
    prepared_.clear();
    if (PQstatus(conn_) != CONNECTION_OK) {
        logError("reset");
        return false;
    }
    return true;
}

PGresult* DatabaseConnection::executeQuery(const std::string& query) {
    if (!isConnected()) {
        last_error_ = "Database not connected";
        Logger::getInstance().error(last_error_);
        return nullptr;
    }

    PGresult* res = PQexec(conn_, query.c_str());

    if (PQresultStatus(res) != PGRES_COMMAND_OK && PQresultStatus(res) != PGRES_TUPLES_OK) {
        logError("query");
        PQclear(res);
        return nullptr;
    }

    return res;
}

PGresult* DatabaseConnection::executePrepared(const std::string& stmt_name,
                                              int n_params,
                                              const char* const* param_values) {
    if (!isConnected()) {
        last_error_ = "Database not connected";
        Logger::getInstance().error(last_error_);
        return nullptr;
    }

    // Text format throughout; a null pointer is SQL NULL
    std::vector<int> param_lengths(static_cast<size_t>(n_params));
    std::vector<int> param_formats(static_cast<size_t>(n_params), 0);
    for (int i = 0; i < n_params; i++) {
        param_lengths[i] = param_values[i] ? static_cast<int>(std::strlen(param_values[i])) : -1;
    }

    PGresult* res = PQexecPrepared(conn_, stmt_name.c_str(), n_params, param_values,
                                   param_lengths.data(), param_formats.data(), 0);

    if (PQresultStatus(res) != PGRES_COMMAND_OK && PQresultStatus(res) != PGRES_TUPLES_OK) {
        const char* message = PQresultErrorMessage(res);
        last_error_ = (message && *message) ? message : "Unknown error";
        Logger::getInstance().error("PostgreSQL prepared statement error (" + stmt_name + "): " + last_error_);
        PQclear(res);
        return nullptr;
    }

    return res;
}

bool DatabaseConnection::prepareStatement(const std::string& stmt_name, const std::string& query) {
    if (!isConnected()) {
        last_error_ = "Database not connected";
        Logger::getInstance().error(last_error_);
        return false;
    }

    PGresult* res = PQprepare(conn_, stmt_name.c_str(), query.c_str(), 0, nullptr);
    const bool ok = PQresultStatus(res) == PGRES_COMMAND_OK;
    if (ok) {
        prepared_.insert(stmt_name);
        Logger::getInstance().debug("Prepared statement '" + stmt_name + "'");
    } else {
        logError("prepare '" + stmt_name + "'");
    }
    PQclear(res);
    return ok;
}

bool DatabaseConnection::isPrepared(const std::string& stmt_name) const {
    return prepared_.count(stmt_name) > 0;
}

bool DatabaseConnection::begin() {
    PGresult* res = executeQuery("BEGIN");
    if (!res) {
        return false;
    }
    PQclear(res);
    return true;
}

bool DatabaseConnection::commit() {
    PGresult* res = executeQuery("COMMIT");
    if (!res) {
        return false;
    }
    PQclear(res);
    return true;
}

void DatabaseConnection::rollback() {
    PGresult* res = executeQuery("ROLLBACK");
    if (res) PQclear(res);
}

std::string DatabaseConnection::escapeIdentifier(const std::string& name) const {
    if (!conn_) {
        return "\"" + name + "\"";
    }
    char* escaped = PQescapeIdentifier(conn_, name.c_str(), name.size());
    if (!escaped) {
        return "\"" + name + "\"";
    }
    std::string result(escaped);
    PQfreemem(escaped);
    return result;
}

std::string DatabaseConnection::getLastError() const {
    if (!last_error_.empty()) {
        return last_error_;
    }
    if (conn_) {
        return PQerrorMessage(conn_);
    }
    return "No connection";
}

void DatabaseConnection::logError(const std::string& context) {
    last_error_ = conn_ ? PQerrorMessage(conn_) : "No connection";
    Logger::getInstance().error("PostgreSQL error (" + context + "): " + last_error_);
}

} // namespace harvester
