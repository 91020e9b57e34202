// ---------------------------------------------------------------------------
// injection_detector.cpp
//
// set-escape 탐지기 구현.
//
// [오탐/미탐 트레이드오프]
// - \bOR\b 는 정상적인 OR 조건도 차단한다. 단일 주체 조회에는 OR 가
//   필요하지 않으므로 허용 가능한 오탐이다.
// - 주석 패턴은 oracle 이 설명용 주석을 덧붙인 쿼리도 차단한다.
//   안전한 대체 쿼리가 함께 제안되므로 사용자 영향은 제한적이다.
// ---------------------------------------------------------------------------

#include "parser/injection_detector.hpp"

#include <utility>

#include <spdlog/spdlog.h>

InjectionDetector::InjectionDetector(std::vector<EscapePattern> patterns) {
    compiled_patterns_.reserve(patterns.size());

    for (auto& p : patterns) {
        try {
            auto re = std::make_shared<const std::regex>(
                p.pattern,
                std::regex_constants::icase | std::regex_constants::ECMAScript
            );
            std::string reason = p.reason.empty()
                ? "matched set-escape pattern: " + p.pattern
                : std::move(p.reason);
            compiled_patterns_.push_back(
                CompiledPattern{std::move(p.pattern), std::move(re), std::move(reason)});

        } catch (const std::regex_error& e) {
            // 건너뛴 패턴만큼 탐지 범위가 줄어든다. 나머지는 계속 적용.
            spdlog::warn(
                "injection_detector: invalid regex pattern '{}', skipping: {}",
                p.pattern, e.what()
            );
        }
    }

    if (compiled_patterns_.empty()) {
        fail_close_active_ = true;
        spdlog::error(
            "injection_detector: no valid escape patterns loaded, "
            "fail-close active, every query will be rejected"
        );
    }
}

InjectionResult InjectionDetector::check(std::string_view sql) const {
    if (fail_close_active_) {
        return InjectionResult{true, "", "no valid patterns loaded"};
    }

    const std::string sql_str(sql);

    for (const auto& cp : compiled_patterns_) {
        if (!cp.compiled) {
            continue;
        }
        if (std::regex_search(sql_str, *cp.compiled)) {
            return InjectionResult{true, cp.source_pattern, cp.reason};
        }
    }

    return InjectionResult{false, "", ""};
}
