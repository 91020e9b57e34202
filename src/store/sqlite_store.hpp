#pragma once

// ---------------------------------------------------------------------------
// sqlite_store.hpp
//
// SQLite 레코드 저장소. ExecutionBoundary + PrincipalDirectory 구현.
//
// [연결 모델]
// - 요청마다 open → execute → close. 연결을 공유하지 않으므로 세션 간
//   트랜잭션 누수가 없고, 인스턴스를 여러 세션에서 동시에 써도 안전하다.
// - SQLITE_OPEN_READONLY 로 연다. 게이트를 통과한 쿼리라도 쓰기는 불가.
// - busy_timeout 초과(SQLITE_BUSY/SQLITE_LOCKED)는 kStoreTimeout.
//
// [알려진 한계]
// - 한 번에 한 문장만 실행한다. prepare 후 남은 꼬리(tail)가 있으면 거부.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "store/execution_boundary.hpp"
#include "store/result_format.hpp"

class SqliteStore final : public ExecutionBoundary, public PrincipalDirectory {
public:
    SqliteStore(std::filesystem::path db_path,
                std::string           table,
                std::uint32_t         busy_timeout_ms);

    ~SqliteStore() override = default;

    SqliteStore(const SqliteStore&)            = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;
    SqliteStore(SqliteStore&&)                 = default;
    SqliteStore& operator=(SqliteStore&&)      = default;

    [[nodiscard]] std::expected<std::string, CollaboratorError>
    execute(std::string_view query) override;

    [[nodiscard]] std::expected<std::optional<Principal>, CollaboratorError>
    get_principal(std::optional<std::int64_t> id) override;

    // query_table
    //   실행 결과를 텍스트 변환 전 표 형태로 돌려준다.
    [[nodiscard]] std::expected<ResultTable, CollaboratorError>
    query_table(std::string_view query);

private:
    std::filesystem::path db_path_;
    std::string           table_;
    std::uint32_t         busy_timeout_ms_;
};
