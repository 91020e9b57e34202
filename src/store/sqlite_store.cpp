// ---------------------------------------------------------------------------
// sqlite_store.cpp
//
// SQLite C API 기반 저장소 구현.
// sqlite3* / sqlite3_stmt* 는 unique_ptr + 커스텀 deleter 로 소유한다.
// ---------------------------------------------------------------------------

#include "store/sqlite_store.hpp"

#include <memory>
#include <utility>

#include <spdlog/spdlog.h>
#include <sqlite3.h>

namespace {

struct DbCloser {
    void operator()(sqlite3* db) const noexcept { sqlite3_close_v2(db); }
};
struct StmtFinalizer {
    void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
};

using DbHandle   = std::unique_ptr<sqlite3, DbCloser>;
using StmtHandle = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

// SQLite 결과 코드 → 협력자 오류 코드
CollaboratorErrorCode classify(int rc) noexcept {
    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return CollaboratorErrorCode::kStoreTimeout;
        case SQLITE_CANTOPEN:
        case SQLITE_NOTADB:
        case SQLITE_CORRUPT:
        case SQLITE_IOERR:
            return CollaboratorErrorCode::kStoreUnavailable;
        default:
            return CollaboratorErrorCode::kQueryFailed;
    }
}

CollaboratorError make_error(int rc, sqlite3* db, std::string_view what, std::string_view context) {
    std::string message(what);
    message += ": ";
    message += (db != nullptr) ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    return CollaboratorError{classify(rc), std::move(message), std::string(context.substr(0, 200))};
}

std::expected<DbHandle, CollaboratorError>
open_readonly(const std::filesystem::path& path, std::uint32_t busy_timeout_ms) {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &raw,
                                   SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX, nullptr);
    DbHandle db(raw);  // 실패해도 핸들은 해제해야 한다
    if (rc != SQLITE_OK) {
        auto err = make_error(rc, db.get(), "cannot open database", path.string());
        err.code = CollaboratorErrorCode::kStoreUnavailable;
        return std::unexpected(std::move(err));
    }
    sqlite3_busy_timeout(db.get(), static_cast<int>(busy_timeout_ms));
    return db;
}

}  // namespace

SqliteStore::SqliteStore(std::filesystem::path db_path,
                         std::string           table,
                         std::uint32_t         busy_timeout_ms)
    : db_path_(std::move(db_path))
    , table_(std::move(table))
    , busy_timeout_ms_(busy_timeout_ms)
{}

std::expected<ResultTable, CollaboratorError>
SqliteStore::query_table(std::string_view query) {
    auto db = open_readonly(db_path_, busy_timeout_ms_);
    if (!db) {
        spdlog::error("sqlite_store: {}", db.error().message);
        return std::unexpected(db.error());
    }

    sqlite3_stmt* raw_stmt = nullptr;
    const char*   tail     = nullptr;
    const int prepare_rc = sqlite3_prepare_v2(
        db->get(), query.data(), static_cast<int>(query.size()), &raw_stmt, &tail);
    StmtHandle stmt(raw_stmt);
    if (prepare_rc != SQLITE_OK) {
        return std::unexpected(make_error(prepare_rc, db->get(), "cannot prepare query", query));
    }
    if (!stmt) {
        return std::unexpected(CollaboratorError{
            CollaboratorErrorCode::kQueryFailed, "query is empty", std::string(query)});
    }

    // 남은 꼬리는 공백/세미콜론만 허용
    const std::string_view rest(tail, static_cast<std::size_t>(query.data() + query.size() - tail));
    if (rest.find_first_not_of(" \t\r\n;") != std::string_view::npos) {
        return std::unexpected(CollaboratorError{
            CollaboratorErrorCode::kQueryFailed,
            "only a single statement may be executed",
            std::string(query.substr(0, 200))});
    }

    ResultTable table;
    const int column_count = sqlite3_column_count(stmt.get());
    table.column_names.reserve(static_cast<std::size_t>(column_count));
    for (int c = 0; c < column_count; ++c) {
        const char* name = sqlite3_column_name(stmt.get(), c);
        table.column_names.emplace_back(name != nullptr ? name : "");
    }

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        ResultRow row;
        row.reserve(static_cast<std::size_t>(column_count));
        for (int c = 0; c < column_count; ++c) {
            if (sqlite3_column_type(stmt.get(), c) == SQLITE_NULL) {
                row.emplace_back(std::nullopt);
                continue;
            }
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), c));
            const int   len  = sqlite3_column_bytes(stmt.get(), c);
            row.emplace_back(std::string(text != nullptr ? text : "", static_cast<std::size_t>(len)));
        }
        table.rows.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        auto err = make_error(rc, db->get(), "query execution failed", query);
        spdlog::warn("sqlite_store: {} ({})", err.message, collaborator_error_name(err.code));
        return std::unexpected(std::move(err));
    }

    spdlog::debug("sqlite_store: query returned {} rows", table.rows.size());
    return table;
}

std::expected<std::string, CollaboratorError>
SqliteStore::execute(std::string_view query) {
    auto table = query_table(query);
    if (!table) {
        return std::unexpected(table.error());
    }
    return format_result(*table);
}

std::expected<std::optional<Principal>, CollaboratorError>
SqliteStore::get_principal(std::optional<std::int64_t> id) {
    auto db = open_readonly(db_path_, busy_timeout_ms_);
    if (!db) {
        spdlog::error("sqlite_store: {}", db.error().message);
        return std::unexpected(db.error());
    }

    // table_ 은 설정 로더에서 식별자 형식으로 검증된 값이다.
    const std::string sql = id
        ? "SELECT id, email, first_name, last_name FROM " + table_ + " WHERE id = ?"
        : "SELECT id, email, first_name, last_name FROM " + table_ + " ORDER BY RANDOM() LIMIT 1";

    sqlite3_stmt* raw_stmt = nullptr;
    const int prepare_rc = sqlite3_prepare_v2(db->get(), sql.c_str(), -1, &raw_stmt, nullptr);
    StmtHandle stmt(raw_stmt);
    if (prepare_rc != SQLITE_OK) {
        return std::unexpected(make_error(prepare_rc, db->get(), "cannot prepare principal lookup", sql));
    }
    if (id) {
        sqlite3_bind_int64(stmt.get(), 1, *id);
    }

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::optional<Principal>{};
    }
    if (rc != SQLITE_ROW) {
        return std::unexpected(make_error(rc, db->get(), "principal lookup failed", sql));
    }

    const auto column_string = [&stmt](int c) {
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), c));
        return std::string(text != nullptr ? text : "");
    };

    Principal principal;
    principal.id               = sqlite3_column_int64(stmt.get(), 0);
    principal.identity_string  = column_string(1);
    principal.display_name     = column_string(2) + " " + column_string(3);
    principal.capability_level = CapabilityLevel::kBasic;
    return std::optional<Principal>{std::move(principal)};
}
