#pragma once

// ---------------------------------------------------------------------------
// text_oracle.hpp
//
// 외부 텍스트 완성(text-completion) 협력자 인터페이스.
// 비결정적이고, 형식이 깨질 수 있고, 느릴 수 있는 블랙박스로 취급한다.
//
// [계약]
// - 동기 호출. 완성된 전체 텍스트를 돌려주거나 실패한다 (부분 결과 없음).
// - system_instruction 은 고정 템플릿이며, 신뢰할 수 없는 요청 텍스트를
//   치환해 넣지 않는다. 요청 텍스트는 user_message 로만 전달된다.
// - 기한 초과는 kOracleTimeout 으로 보고한다. 호출자는 이를 파싱 실패와
//   동일하게 fail-close 로 처리한다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <string_view>

#include "common/types.hpp"  // CollaboratorError

class TextOracle {
public:
    virtual ~TextOracle() = default;

    [[nodiscard]] virtual std::expected<std::string, CollaboratorError>
    complete(std::string_view system_instruction, std::string_view user_message) = 0;
};
