#pragma once

// ---------------------------------------------------------------------------
// injection_detector.hpp
//
// 정규식 패턴 기반 set-escape 탐지기.
// 후보 쿼리가 현재 주체의 행(row) 밖으로 결과 집합을 넓히거나
// 데이터/스키마를 변경할 수 있는 구문을 포함하는지 검사한다.
//
// [탐지 대상 패턴 (기본값, config 에서 로드)]
// - UNION / JOIN / 중첩 SELECT   (다른 행·테이블 결합)
// - OR, LIKE/GLOB                (범위 확장 술어)
// - 1=1, 'a'='a'                 (tautology)
// - substr()/char()/hex() 등     (추출 함수)
// - sqlite_master 등             (스키마 테이블)
// - 주석, 변경 키워드
//
// [설계 한계 / 알려진 우회 가능성]
// 1. 문자열 리터럴 내부도 검사하므로 'Portland OR' 같은 값에서 오탐 발생.
//    차단 우선 원칙에 따라 허용한다.
// 2. 정규식 기반이므로 문법적 의미는 모른다. 구조 검사는 PolicyEngine 의
//    scope gate 가 담당하고, 이 모듈은 그 일부로 호출된다.
//
// [보안 원칙]
// - 유효한 패턴이 하나도 없으면 fail-close: 모든 쿼리를 detected 로 판정.
// ---------------------------------------------------------------------------

#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "policy/rule.hpp"  // EscapePattern

// ---------------------------------------------------------------------------
// InjectionResult
//   탐지 결과. matched_pattern 은 감사 로그용이며 사용자에게 노출하지 않는다.
// ---------------------------------------------------------------------------
struct InjectionResult {
    bool        detected{false};
    std::string matched_pattern{};
    std::string reason{};
};

// ---------------------------------------------------------------------------
// InjectionDetector
//   생성 시 패턴을 컴파일하고 check() 에서 첫 번째 매칭을 보고한다.
//   생성자에서 regex 컴파일 비용이 발생하므로 인스턴스를 재사용할 것.
// ---------------------------------------------------------------------------
class InjectionDetector {
public:
    // patterns: ECMAScript 정규식 + 사유. 대소문자 무시로 컴파일한다.
    //   잘못된 패턴은 경고 로그 후 건너뛴다.
    explicit InjectionDetector(std::vector<EscapePattern> patterns);

    ~InjectionDetector() = default;

    InjectionDetector(const InjectionDetector&)            = delete;
    InjectionDetector& operator=(const InjectionDetector&) = delete;
    InjectionDetector(InjectionDetector&&)                 = default;
    InjectionDetector& operator=(InjectionDetector&&)      = default;

    [[nodiscard]] InjectionResult check(std::string_view sql) const;

    // 컴파일에 성공한 패턴 수
    [[nodiscard]] std::size_t pattern_count() const noexcept { return compiled_patterns_.size(); }

    [[nodiscard]] bool fail_close_active() const noexcept { return fail_close_active_; }

private:
    struct CompiledPattern {
        std::string                       source_pattern;
        std::shared_ptr<const std::regex> compiled;
        std::string                       reason;
    };

    std::vector<CompiledPattern> compiled_patterns_;
    bool                         fail_close_active_{false};
};
