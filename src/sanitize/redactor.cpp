// ---------------------------------------------------------------------------
// redactor.cpp
//
// [오탐/미탐 트레이드오프]
// - 전화번호 규칙은 10자리 숫자 묶음을 모두 축약한다. 같은 형태의
//   다른 숫자(계좌번호 등)도 축약되지만 이 저장소에는 해당 컬럼이 없다.
// - 주소 규칙은 "번지 ..., 도시, ST 12345" 형태(미국식)와 군사 우편
//   주소(APO/FPO/DPO)만 인식한다. 다른 형식은 통과하므로 oracle 판정이
//   함께 필요하다.
// ---------------------------------------------------------------------------

#include "sanitize/redactor.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <spdlog/spdlog.h>

Redactor::Redactor(std::vector<RedactionRule> rules) {
    rules_.reserve(rules.size());
    for (auto& r : rules) {
        try {
            auto re = std::make_shared<const std::regex>(r.pattern, std::regex_constants::ECMAScript);
            rules_.push_back(CompiledRule{std::move(r.name), std::move(re), std::move(r.replacement)});
        } catch (const std::regex_error& e) {
            spdlog::warn("redactor: invalid regex for rule '{}', skipping: {}", r.name, e.what());
        }
    }

    if (rules_.empty()) {
        fail_close_active_ = true;
        spdlog::error("redactor: no valid redaction rules loaded, "
                      "fail-close active, every response will be withheld");
    }
}

RedactionResult Redactor::apply(std::string_view text) const {
    RedactionResult result;
    if (fail_close_active_) {
        result.withheld = true;
        return result;
    }

    result.text = std::string(text);
    for (const auto& rule : rules_) {
        if (!rule.compiled || !std::regex_search(result.text, *rule.compiled)) {
            continue;
        }
        std::string replaced = std::regex_replace(result.text, *rule.compiled, rule.replacement);
        if (replaced != result.text) {
            result.text = std::move(replaced);
            result.applied_rules.push_back(rule.name);
        }
    }
    return result;
}

std::vector<std::string> Redactor::find_emails(std::string_view text) {
    static const std::regex email_re(
        R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})", std::regex_constants::ECMAScript);

    std::vector<std::string> emails;
    const std::string haystack(text);
    for (auto it = std::sregex_iterator(haystack.begin(), haystack.end(), email_re);
         it != std::sregex_iterator(); ++it) {
        std::string email = it->str();
        std::transform(email.begin(), email.end(), email.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        emails.push_back(std::move(email));
    }
    return emails;
}
