#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_type_map.hpp"
#include "db/connection_descriptor.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <cstring>
#include <format>
#include <type_traits>

namespace nlquery {

namespace {

struct StmtDeleter {
    void operator()(MYSQL_STMT* stmt) const noexcept {
        if (stmt) {
            mysql_stmt_close(stmt);
        }
    }
};
using StmtPtr = std::unique_ptr<MYSQL_STMT, StmtDeleter>;

struct MysqlResDeleter {
    void operator()(MYSQL_RES* res) const noexcept {
        if (res) {
            mysql_free_result(res);
        }
    }
};
using MysqlResPtr = std::unique_ptr<MYSQL_RES, MysqlResDeleter>;

// bool in libmysqlclient 8.x, my_bool in MariaDB Connector/C
using BindFlag = std::remove_pointer_t<decltype(MYSQL_BIND{}.is_null)>;

constexpr unsigned int ER_QUERY_TIMEOUT_CODE = 3024;     // max_execution_time exceeded
constexpr unsigned int ER_QUERY_INTERRUPTED_CODE = 1317;
constexpr unsigned int CR_SERVER_GONE_ERROR_CODE = 2006;
constexpr unsigned int CR_SERVER_LOST_CODE = 2013;
constexpr unsigned long MAX_INITIAL_BUFFER = 64 * 1024;

} // anonymous namespace

MysqlConnection::MysqlConnection(MYSQL* conn)
    : conn_(conn) {}

MysqlConnection::~MysqlConnection() {
    close();
}

ErrorCategory MysqlConnection::categorize(unsigned int error_code) {
    if (error_code == ER_QUERY_TIMEOUT_CODE || error_code == ER_QUERY_INTERRUPTED_CODE) {
        return ErrorCategory::TIMEOUT_ERROR;
    }
    if (error_code == CR_SERVER_GONE_ERROR_CODE || error_code == CR_SERVER_LOST_CODE ||
        error_code >= 2000 && error_code < 3000) {
        return ErrorCategory::CONNECTION_ERROR;
    }
    return ErrorCategory::SYNTAX_ERROR;
}

DbResultSet MysqlConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    if (!conn_) {
        return DbResultSet::failure(ErrorCategory::CONNECTION_ERROR, "Connection is null");
    }
    return params.empty() ? execute_plain(sql) : execute_prepared(sql, params);
}

DbResultSet MysqlConnection::execute_plain(const std::string& sql) {
    if (mysql_query(conn_, sql.c_str()) != 0) {
        return DbResultSet::failure(categorize(mysql_errno(conn_)), mysql_error(conn_));
    }

    MysqlResPtr res(mysql_store_result(conn_));
    if (res) {
        return process_result_set(res.get());
    }
    if (mysql_field_count(conn_) == 0) {
        DbResultSet result;
        result.success = true;
        return result;
    }
    // Expected a result set but got none
    return DbResultSet::failure(categorize(mysql_errno(conn_)), mysql_error(conn_));
}

DbResultSet MysqlConnection::execute_prepared(const std::string& sql, const std::vector<std::string>& params) {
    StmtPtr stmt(mysql_stmt_init(conn_));
    if (!stmt) {
        return DbResultSet::failure(ErrorCategory::CONNECTION_ERROR, mysql_error(conn_));
    }
    const auto stmt_failure = [&stmt]() {
        return DbResultSet::failure(categorize(mysql_stmt_errno(stmt.get())), mysql_stmt_error(stmt.get()));
    };

    if (mysql_stmt_prepare(stmt.get(), sql.c_str(), sql.size()) != 0) {
        return stmt_failure();
    }
    if (mysql_stmt_param_count(stmt.get()) != params.size()) {
        return DbResultSet::failure(ErrorCategory::SYNTAX_ERROR,
            std::format("Statement expects {} parameters, {} supplied",
                mysql_stmt_param_count(stmt.get()), params.size()));
    }

    std::vector<MYSQL_BIND> param_binds(params.size());
    std::vector<unsigned long> param_lengths(params.size());
    for (size_t i = 0; i < params.size(); ++i) {
        std::memset(&param_binds[i], 0, sizeof(MYSQL_BIND));
        param_lengths[i] = static_cast<unsigned long>(params[i].size());
        param_binds[i].buffer_type = MYSQL_TYPE_STRING;
        param_binds[i].buffer = const_cast<char*>(params[i].data());
        param_binds[i].buffer_length = param_lengths[i];
        param_binds[i].length = &param_lengths[i];
    }
    if (mysql_stmt_bind_param(stmt.get(), param_binds.data()) != 0 ||
        mysql_stmt_execute(stmt.get()) != 0) {
        return stmt_failure();
    }

    MysqlResPtr meta(mysql_stmt_result_metadata(stmt.get()));
    if (!meta) {
        DbResultSet result;
        result.success = true;
        return result;
    }

    BindFlag update_max = 1;
    mysql_stmt_attr_set(stmt.get(), STMT_ATTR_UPDATE_MAX_LENGTH, &update_max);
    if (mysql_stmt_store_result(stmt.get()) != 0) {
        return stmt_failure();
    }

    DbResultSet result;
    result.success = true;

    const unsigned int num_fields = mysql_num_fields(meta.get());
    MYSQL_FIELD* fields = mysql_fetch_fields(meta.get());

    std::vector<MYSQL_BIND> out(num_fields);
    std::vector<std::vector<char>> buffers(num_fields);
    std::vector<unsigned long> lengths(num_fields);
    std::vector<BindFlag> nulls(num_fields);

    for (unsigned int i = 0; i < num_fields; ++i) {
        result.column_names.emplace_back(fields[i].name);
        result.column_types.push_back(MysqlTypeMap::build_type_info(fields[i].type));

        const unsigned long size = std::max<unsigned long>(
            {fields[i].max_length, std::min<unsigned long>(fields[i].length, MAX_INITIAL_BUFFER), 64});
        buffers[i].resize(size + 1);

        std::memset(&out[i], 0, sizeof(MYSQL_BIND));
        out[i].buffer_type = MYSQL_TYPE_STRING;
        out[i].buffer = buffers[i].data();
        out[i].buffer_length = static_cast<unsigned long>(buffers[i].size());
        out[i].length = &lengths[i];
        out[i].is_null = &nulls[i];
    }
    if (mysql_stmt_bind_result(stmt.get(), out.data()) != 0) {
        return stmt_failure();
    }

    int rc = 0;
    while ((rc = mysql_stmt_fetch(stmt.get())) == 0 || rc == MYSQL_DATA_TRUNCATED) {
        std::vector<std::string> row;
        row.reserve(num_fields);
        for (unsigned int i = 0; i < num_fields; ++i) {
            if (nulls[i]) {
                row.emplace_back();
                continue;
            }
            if (lengths[i] <= buffers[i].size()) {
                row.emplace_back(buffers[i].data(), lengths[i]);
                continue;
            }
            // Truncated: fetch the full value into a dedicated buffer
            std::string full(lengths[i], '\0');
            MYSQL_BIND column_bind;
            std::memset(&column_bind, 0, sizeof(MYSQL_BIND));
            unsigned long full_length = 0;
            column_bind.buffer_type = MYSQL_TYPE_STRING;
            column_bind.buffer = full.data();
            column_bind.buffer_length = static_cast<unsigned long>(full.size());
            column_bind.length = &full_length;
            if (mysql_stmt_fetch_column(stmt.get(), &column_bind, i, 0) != 0) {
                return stmt_failure();
            }
            full.resize(std::min<unsigned long>(full_length, full.size()));
            row.push_back(std::move(full));
        }
        result.rows.push_back(std::move(row));
    }
    if (rc != MYSQL_NO_DATA) {
        return stmt_failure();
    }
    return result;
}

DbResultSet MysqlConnection::process_result_set(MYSQL_RES* res) {
    DbResultSet result;
    result.success = true;

    const unsigned int num_fields = mysql_num_fields(res);
    MYSQL_FIELD* fields = mysql_fetch_fields(res);

    result.column_names.reserve(num_fields);
    result.column_types.reserve(num_fields);
    for (unsigned int i = 0; i < num_fields; ++i) {
        result.column_names.emplace_back(fields[i].name);
        result.column_types.push_back(MysqlTypeMap::build_type_info(fields[i].type));
    }

    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res)) != nullptr) {
        const unsigned long* lengths = mysql_fetch_lengths(res);
        std::vector<std::string> row_data;
        row_data.reserve(num_fields);

        for (unsigned int i = 0; i < num_fields; ++i) {
            if (row[i]) {
                row_data.emplace_back(row[i], lengths[i]);
            } else {
                row_data.emplace_back();  // NULL → empty string
            }
        }
        result.rows.push_back(std::move(row_data));
    }
    return result;
}

bool MysqlConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_) {
        return false;
    }

    if (mysql_ping(conn_) != 0) {
        return false;
    }

    if (!health_check_query.empty()) {
        if (mysql_query(conn_, health_check_query.c_str()) != 0) {
            return false;
        }
        MysqlResPtr res(mysql_store_result(conn_));
    }

    return true;
}

bool MysqlConnection::is_connected() const {
    return conn_ != nullptr;
}

bool MysqlConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    // MySQL 5.7.8+; applies to read-only SELECT statements only
    const std::string sql = std::format("SET SESSION max_execution_time = {}", timeout_ms);
    return mysql_query(conn_, sql.c_str()) == 0;
}

void MysqlConnection::close() {
    if (conn_) {
        mysql_close(conn_);
        conn_ = nullptr;
    }
}

// ============================================================================
// MysqlConnectionFactory
// ============================================================================

ConnectionResult MysqlConnectionFactory::open(const std::string& connection_string) {

    const auto params = parse_connection_string(connection_string);

    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        return ConnectionResult::error(ErrorCategory::CONNECTION_ERROR, "mysql_init failed");
    }

    unsigned int timeout = 5;
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
    mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");

    MYSQL* result = mysql_real_connect(
        conn,
        params.host.c_str(),
        params.user.c_str(),
        params.password.c_str(),
        params.database.c_str(),
        params.port,
        nullptr,  // unix socket
        0         // client flags
    );

    if (!result) {
        auto message = std::format("MySQL connection to {} failed: {}",
            redact_connection_string(connection_string), mysql_error(conn));
        mysql_close(conn);
        return ConnectionResult::error(ErrorCategory::CONNECTION_ERROR, std::move(message));
    }

    return ConnectionResult::ok(std::make_unique<MysqlConnection>(conn));
}

MysqlConnectionFactory::ConnParams MysqlConnectionFactory::parse_connection_string(
    const std::string& conn_str) {

    ConnParams params;
    params.host = "localhost";
    params.port = 3306;

    std::string_view sv(conn_str);
    if (sv.starts_with("mysql://")) {
        sv.remove_prefix(8);
    } else if (sv.starts_with("mariadb://")) {
        sv.remove_prefix(10);
    }

    // Options after '?' are not forwarded
    if (const size_t q = sv.find('?'); q != std::string_view::npos) {
        sv = sv.substr(0, q);
    }

    // Credentials end at the last '@' so passwords may contain '@'
    const size_t at_pos = sv.rfind('@');
    if (at_pos != std::string_view::npos) {
        const std::string_view creds = sv.substr(0, at_pos);
        sv.remove_prefix(at_pos + 1);

        const size_t colon_pos = creds.find(':');
        if (colon_pos != std::string_view::npos) {
            params.user = std::string(creds.substr(0, colon_pos));
            params.password = std::string(creds.substr(colon_pos + 1));
        } else {
            params.user = std::string(creds);
        }
    }

    std::string_view host_port = sv;
    if (const size_t slash_pos = sv.find('/'); slash_pos != std::string_view::npos) {
        host_port = sv.substr(0, slash_pos);
        params.database = std::string(sv.substr(slash_pos + 1));
    }

    if (const size_t colon_pos = host_port.find(':'); colon_pos != std::string_view::npos) {
        params.host = std::string(host_port.substr(0, colon_pos));
        params.port = utils::parse_int<unsigned int>(host_port.substr(colon_pos + 1), 3306);
    } else if (!host_port.empty()) {
        params.host = std::string(host_port);
    }

    return params;
}

} // namespace nlquery
