#pragma once

// ---------------------------------------------------------------------------
// json_text.hpp
//
// 감사 로그 JSON 과 oracle 요청 본문에서 공유하는 JSON 문자열 이스케이프.
// 직렬화만 담당한다. 파싱은 yaml-cpp (JSON ⊂ YAML) 를 사용한다.
// ---------------------------------------------------------------------------

#include <cstdio>
#include <string>
#include <string_view>

[[nodiscard]] inline std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (const char c : str) {
        const auto ch = static_cast<unsigned char>(c);
        switch (ch) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result.push_back(c);
                }
                break;
        }
    }
    return result;
}
