// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML 가드 설정을 GuardConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 설정을 반환하지 않는다.
// - Fail-close: sql_rules.block_patterns 또는 redaction.rules 가 비어 있으면
//   std::unexpected 반환. 빈 패턴 목록은 탐지기/redactor 를 fail-close
//   상태로 만들어 모든 요청을 막으므로, 설정 실수로 보고 조기에 알린다.
// - 필드 누락 시 구조체 기본값을 적용한다.
//
// [오탐/미탐 트레이드오프]
// - 잘못된 regex 는 로드 시 경고만 하고, 컴파일 시점(InjectionDetector,
//   Redactor)에서 건너뛴다. 건너뛴 만큼 탐지/정제 범위가 줄어든다.
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

// 섹션 파서 내부에서 스키마 오류를 알리는 예외. load() 에서 unexpected 로 변환된다.
struct SchemaError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// ---------------------------------------------------------------------------
// 내부 헬퍼: regex 패턴 사전 검증 (경고만)
// ---------------------------------------------------------------------------
void validate_pattern(const std::string& section, const std::string& pattern) {
    try {
        std::regex re(pattern, std::regex_constants::icase | std::regex_constants::ECMAScript);
        (void)re;
    } catch (const std::regex_error& e) {
        spdlog::warn(
            "policy_loader: {} pattern '{}' is invalid regex and will be skipped: {}",
            section, pattern, e.what()
        );
    }
}

[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

[[nodiscard]] bool read_bool(const YAML::Node& node, bool fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        spdlog::warn("policy_loader: '{}' is not a boolean, using default {}",
                     node.Scalar(), fallback);
        return fallback;
    }
}

[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    return node.as<std::string>();
}

[[nodiscard]] std::uint32_t read_duration(const YAML::Node& node,
                                          std::uint32_t     fallback,
                                          const char*       key) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    const auto parsed = PolicyLoader::parse_duration_ms(node.Scalar());
    if (!parsed) {
        throw SchemaError(fmt::format("invalid duration '{}' for '{}'", node.Scalar(), key));
    }
    return *parsed;
}

// ---------------------------------------------------------------------------
// 섹션 파서
// ---------------------------------------------------------------------------
void parse_global(const YAML::Node& node, GlobalConfig& cfg) {
    if (!node || !node.IsMap()) {
        return;
    }
    cfg.log_level = read_string(node["log_level"], cfg.log_level);
    cfg.log_path  = read_string(node["log_path"],  cfg.log_path);

    if (cfg.log_level != "debug" && cfg.log_level != "info" &&
        cfg.log_level != "warn"  && cfg.log_level != "error") {
        throw SchemaError(fmt::format("global.log_level '{}' must be debug|info|warn|error",
                                      cfg.log_level));
    }
}

void parse_store(const YAML::Node& node, StoreSettings& cfg) {
    if (!node || !node.IsMap()) {
        return;
    }
    cfg.path      = read_string(node["path"],      cfg.path);
    cfg.table     = read_string(node["table"],     cfg.table);
    cfg.id_column = read_string(node["id_column"], cfg.id_column);
    if (node["allowed_columns"]) {
        cfg.allowed_columns = read_string_sequence(node["allowed_columns"]);
        if (cfg.allowed_columns.empty()) {
            throw SchemaError("store.allowed_columns must list at least one column");
        }
    }
    cfg.busy_timeout_ms = read_duration(node["busy_timeout"], cfg.busy_timeout_ms, "store.busy_timeout");

    static const std::regex ident_re(R"(^[A-Za-z_][A-Za-z0-9_]*$)");
    if (!std::regex_match(cfg.table, ident_re) || !std::regex_match(cfg.id_column, ident_re)) {
        throw SchemaError("store.table and store.id_column must be plain identifiers");
    }
}

void parse_oracle(const YAML::Node& node, OracleSettings& cfg) {
    if (!node || !node.IsMap()) {
        return;
    }
    cfg.host        = read_string(node["host"],        cfg.host);
    cfg.target      = read_string(node["target"],      cfg.target);
    cfg.model       = read_string(node["model"],       cfg.model);
    cfg.api_key_env = read_string(node["api_key_env"], cfg.api_key_env);
    cfg.timeout_ms  = read_duration(node["timeout"], cfg.timeout_ms, "oracle.timeout");

    if (node["port"]) {
        const auto port = node["port"].as<std::uint32_t>();
        if (port == 0 || port > 65535) {
            throw SchemaError(fmt::format("oracle.port {} is out of range", port));
        }
        cfg.port = static_cast<std::uint16_t>(port);
    }
    if (node["temperature"]) {
        cfg.temperature = node["temperature"].as<double>();
    }
}

void parse_pipeline(const YAML::Node& node, PipelineSettings& cfg) {
    if (!node || !node.IsMap()) {
        return;
    }
    cfg.combined_single_pass = read_bool(node["combined_single_pass"], cfg.combined_single_pass);
    cfg.oracle_sql_review    = read_bool(node["oracle_sql_review"],    cfg.oracle_sql_review);
    cfg.oracle_output_review = read_bool(node["oracle_output_review"], cfg.oracle_output_review);
    cfg.fallback_answers     = read_bool(node["fallback_answers"],     cfg.fallback_answers);
}

// sql_rules.block_patterns: "regex" 또는 {pattern, reason}
[[nodiscard]] std::vector<EscapePattern> parse_block_patterns(const YAML::Node& sql_node) {
    if (!sql_node || !sql_node.IsMap() || !sql_node["block_patterns"]) {
        return default_escape_patterns();
    }
    const YAML::Node& list = sql_node["block_patterns"];
    if (!list.IsSequence()) {
        throw SchemaError("sql_rules.block_patterns must be a sequence");
    }

    std::vector<EscapePattern> patterns;
    patterns.reserve(list.size());
    for (const auto& item : list) {
        EscapePattern p{};
        if (item.IsScalar()) {
            p.pattern = item.as<std::string>();
        } else if (item.IsMap()) {
            p.pattern = read_string(item["pattern"], "");
            p.reason  = read_string(item["reason"], "");
        }
        if (p.pattern.empty()) {
            throw SchemaError("sql_rules.block_patterns entries need a non-empty pattern");
        }
        patterns.push_back(std::move(p));
    }
    return patterns;
}

// redaction.rules: {name, pattern, replacement}
[[nodiscard]] std::vector<RedactionRule> parse_redaction_rules(const YAML::Node& red_node) {
    if (!red_node || !red_node.IsMap() || !red_node["rules"]) {
        return default_redaction_rules();
    }
    const YAML::Node& list = red_node["rules"];
    if (!list.IsSequence()) {
        throw SchemaError("redaction.rules must be a sequence");
    }

    std::vector<RedactionRule> rules;
    rules.reserve(list.size());
    for (const auto& item : list) {
        if (!item.IsMap()) {
            throw SchemaError("redaction.rules entries must be maps");
        }
        RedactionRule r{};
        r.name        = read_string(item["name"], "");
        r.pattern     = read_string(item["pattern"], "");
        r.replacement = read_string(item["replacement"], "");
        if (r.name.empty() || r.pattern.empty()) {
            throw SchemaError("redaction.rules entries need a name and a pattern");
        }
        rules.push_back(std::move(r));
    }
    return rules;
}

std::expected<GuardConfig, std::string> fail(std::string err) {
    spdlog::error("{}", err);
    return std::unexpected(std::move(err));
}

// ---------------------------------------------------------------------------
// build_config: 루트 노드 → GuardConfig
// ---------------------------------------------------------------------------
std::expected<GuardConfig, std::string>
build_config(const YAML::Node& root, const std::string& source) {
    if (!root || !root.IsMap()) {
        return fail(fmt::format("policy_loader: '{}' is not a valid YAML map (top-level)", source));
    }

    GuardConfig cfg{};

    // 섹션별 try-catch: 오류 메시지에 섹션 이름을 남긴다.
    const auto run_section = [&](const char* name, auto&& fn) -> std::optional<std::string> {
        try {
            fn();
        } catch (const SchemaError& e) {
            return fmt::format("policy_loader: invalid '{}' section: {}", name, e.what());
        } catch (const YAML::Exception& e) {
            return fmt::format("policy_loader: error parsing '{}' section: {}", name, e.what());
        }
        return std::nullopt;
    };

    if (auto err = run_section("global", [&] { parse_global(root["global"], cfg.global); })) {
        return fail(*err);
    }
    if (auto err = run_section("store", [&] { parse_store(root["store"], cfg.store); })) {
        return fail(*err);
    }
    if (auto err = run_section("oracle", [&] { parse_oracle(root["oracle"], cfg.oracle); })) {
        return fail(*err);
    }
    if (auto err = run_section("pipeline", [&] { parse_pipeline(root["pipeline"], cfg.pipeline); })) {
        return fail(*err);
    }
    if (auto err = run_section("sql_rules", [&] {
            cfg.block_patterns = parse_block_patterns(root["sql_rules"]);
        })) {
        return fail(*err);
    }
    if (auto err = run_section("redaction", [&] {
            cfg.redaction_rules = parse_redaction_rules(root["redaction"]);
        })) {
        return fail(*err);
    }
    if (auto err = run_section("sensitive_fields", [&] {
            if (root["sensitive_fields"]) {
                cfg.sensitive_fields = read_string_sequence(root["sensitive_fields"]);
            }
        })) {
        return fail(*err);
    }

    // fail-close 연계: 빈 목록은 설정 실수로 간주
    if (cfg.block_patterns.empty()) {
        return fail("policy_loader: sql_rules.block_patterns must have at least one pattern "
                    "(an empty list would reject every query)");
    }
    if (cfg.redaction_rules.empty()) {
        return fail("policy_loader: redaction.rules must have at least one rule "
                    "(an empty list would withhold every response)");
    }

    for (const auto& p : cfg.block_patterns) {
        validate_pattern("block", p.pattern);
    }
    for (const auto& r : cfg.redaction_rules) {
        validate_pattern("redaction", r.pattern);
    }

    spdlog::info(
        "policy_loader: config loaded from '{}': block_patterns={}, redaction_rules={}, "
        "sensitive_fields={}, combined_single_pass={}",
        source,
        cfg.block_patterns.size(),
        cfg.redaction_rules.size(),
        cfg.sensitive_fields.size(),
        cfg.pipeline.combined_single_pass
    );

    return cfg;
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyLoader::parse_duration_ms
// ---------------------------------------------------------------------------
std::optional<std::uint32_t> PolicyLoader::parse_duration_ms(std::string_view raw) {
    if (raw.empty()) {
        return std::nullopt;
    }
    const char* begin = raw.data();
    const char* end   = raw.data() + raw.size();

    std::uint32_t value{0};
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr == begin) {
        return std::nullopt;
    }

    const std::string_view unit(ptr, static_cast<std::size_t>(end - ptr));
    if (unit == "ms") {
        return value;
    }
    if (unit.empty() || unit == "s") {
        if (value > UINT32_MAX / 1000) {
            return std::nullopt;
        }
        return value * 1000;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// PolicyLoader::load
// ---------------------------------------------------------------------------
std::expected<GuardConfig, std::string>
PolicyLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        return fail(fmt::format(
            "policy_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message()
        ));
    }

    spdlog::info("policy_loader: loading config from '{}'", canonical_path.string());

    // 2. YAML 파일 로드
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        return fail(fmt::format(
            "policy_loader: cannot open file '{}': {}", canonical_path.string(), e.what()));
    } catch (const YAML::ParserException& e) {
        return fail(fmt::format(
            "policy_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,   // yaml-cpp 는 0-based
            e.mark.column + 1,
            e.what()
        ));
    } catch (const YAML::Exception& e) {
        return fail(fmt::format(
            "policy_loader: YAML error in '{}': {}", canonical_path.string(), e.what()));
    }

    return build_config(root, canonical_path.string());
}

std::expected<GuardConfig, std::string>
PolicyLoader::load_from_string(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::ParserException& e) {
        return fail(fmt::format(
            "policy_loader: YAML parse error at line {}, col {}: {}",
            e.mark.line + 1, e.mark.column + 1, e.what()));
    } catch (const YAML::Exception& e) {
        return fail(fmt::format("policy_loader: YAML error: {}", e.what()));
    }
    return build_config(root, "<inline>");
}
