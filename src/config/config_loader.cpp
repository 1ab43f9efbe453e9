#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "detector/languages.hpp"

#include <toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <regex>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace docanon {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/**
 * @brief Expand ${VAR_NAME} patterns with environment variables
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_node(toml::node& node);

void expand_table(toml::table& tbl) {
    for (auto& [key, val] : tbl) expand_node(val);
}

void expand_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) *s = std::move(expanded);
    } else if (auto* tbl = node.as_table()) {
        expand_table(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) expand_node(elem);
    }
}

/**
 * @brief Deep-merge: overlay wins for scalars, arrays concatenate
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        auto* base_node = base.get(key.str());
        if (val.is_table() && base_node && base_node->is_table()) {
            merge_tables(*base_node->as_table(), *val.as_table());
        } else if (val.is_array() && base_node && base_node->is_array()) {
            auto& base_arr = *base_node->as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::filesystem::path& base_dir,
                      std::unordered_set<std::string>& visited, int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(std::format("Config include depth exceeds {}", kMaxIncludeDepth));
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (const auto* arr = inc_node.as_array()) {
        for (const auto& item : *arr) {
            if (const auto* s = item.as_string()) paths.emplace_back(s->get());
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(base_dir / rel_path).string();
        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        resolve_includes(included, fs::path(abs_path).parent_path(), visited, depth + 1);

        // included is the base, the including file overlays it
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_table(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    namespace fs = std::filesystem;
    auto result = toml::parse_file(file_path);

    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, fs::path(file_path).parent_path(), visited, 0);

    expand_table(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) result.emplace_back(s->get());
        }
    }
    return result;
}

// ---- Section extractors ----------------------------------------------------

AnonymizationSection extract_anonymization(const toml::table& root) {
    AnonymizationSection cfg;
    const auto* section = root["anonymization"].as_table();
    if (!section) return cfg;
    const auto& s = *section;

    cfg.language = s["language"].value_or(cfg.language);
    cfg.allow_list = toml_string_array(s, "allow_list");
    cfg.preserve_entities = toml_string_array(s, "preserve_entities");
    if (const auto len = s["slug_length"].value<int64_t>()) {
        cfg.slug_length = *len;
    }
    cfg.batch_size = s["batch_size"].value_or(cfg.batch_size);
    cfg.score_threshold = s["score_threshold"].value_or(cfg.score_threshold);
    return cfg;
}

SecretConfig extract_secret(const toml::table& root) {
    SecretConfig cfg;
    if (const auto* s = root["secret"].as_table()) {
        cfg.env_var = (*s)["env_var"].value_or(cfg.env_var);
    }
    return cfg;
}

RegistryConfig extract_registry(const toml::table& root) {
    RegistryConfig cfg;
    if (const auto* s = root["registry"].as_table()) {
        cfg.backend = (*s)["backend"].value_or(cfg.backend);
        cfg.path = (*s)["path"].value_or(cfg.path);
        cfg.connection_string = (*s)["connection_string"].value_or(""s);
    }
    return cfg;
}

OutputConfig extract_output(const toml::table& root) {
    OutputConfig cfg;
    if (const auto* s = root["output"].as_table()) {
        cfg.directory = (*s)["directory"].value_or(cfg.directory);
        cfg.report_directory = (*s)["report_directory"].value_or(cfg.report_directory);
    }
    return cfg;
}

OcrConfig extract_ocr(const toml::table& root) {
    OcrConfig cfg;
    if (const auto* s = root["ocr"].as_table()) {
        cfg.enabled = (*s)["enabled"].value_or(cfg.enabled);
        cfg.language = (*s)["language"].value_or(cfg.language);
        cfg.tessdata_path = (*s)["tessdata_path"].value_or(""s);
    }
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* s = root["logging"].as_table()) {
        cfg.level = (*s)["level"].value_or(cfg.level);
        cfg.file = (*s)["file"].value_or(""s);
    }
    return cfg;
}

std::vector<CustomRecognizer> extract_recognizers(const toml::table& root) {
    std::vector<CustomRecognizer> recognizers;
    const auto* arr = root["recognizers"].as_array();
    if (!arr) return recognizers;

    for (const auto& elem : *arr) {
        const auto* tbl = elem.as_table();
        if (!tbl) continue;
        CustomRecognizer rec;
        rec.entity_type = (*tbl)["entity_type"].value_or(""s);
        rec.patterns = toml_string_array(*tbl, "patterns");
        rec.score = (*tbl)["score"].value_or(rec.score);
        recognizers.push_back(std::move(rec));
    }
    return recognizers;
}

AnonymizerConfig extract_all_sections(const toml::table& tbl) {
    AnonymizerConfig config;
    config.anonymization = extract_anonymization(tbl);
    config.secret = extract_secret(tbl);
    config.registry = extract_registry(tbl);
    config.output = extract_output(tbl);
    config.ocr = extract_ocr(tbl);
    config.logging = extract_logging(tbl);
    config.recognizers = extract_recognizers(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// AnonymizerConfig
// ============================================================================

AnonymizationConfig AnonymizerConfig::to_anonymization_config() const {
    AnonymizationConfig cfg;
    cfg.language = anonymization.language;
    cfg.allow_list.insert(anonymization.allow_list.begin(), anonymization.allow_list.end());
    for (const auto& type : anonymization.preserve_entities) {
        const auto upper = utils::to_upper(utils::trim(type));
        if (!upper.empty()) cfg.preserve_entity_types.insert(upper);
    }
    if (anonymization.slug_length) {
        cfg.slug_length = static_cast<size_t>(*anonymization.slug_length);
    }
    cfg.score_threshold = anonymization.score_threshold;
    return cfg;
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AnonymizerConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AnonymizerConfig& config) {
    std::vector<std::string> errors;
    const auto& anon = config.anonymization;

    if (!is_supported_language(anon.language)) {
        errors.push_back(std::format("anonymization.language '{}' is not supported", anon.language));
    }
    if (anon.slug_length && !utils::in_range<1, 64>(*anon.slug_length)) {
        errors.push_back(std::format("anonymization.slug_length must be 1-64, got {}", *anon.slug_length));
    }
    if (anon.batch_size <= 0) {
        errors.push_back(std::format("anonymization.batch_size must be > 0, got {}", anon.batch_size));
    }
    if (anon.score_threshold < 0.0 || anon.score_threshold > 1.0) {
        errors.push_back(std::format("anonymization.score_threshold must be in [0, 1], got {}",
            anon.score_threshold));
    }

    if (config.secret.env_var.empty()) {
        errors.push_back("secret.env_var must not be empty");
    }

    try {
        switch (parse_database_type(config.registry.backend)) {
            case DatabaseType::SQLITE:
                if (config.registry.path.empty()) {
                    errors.push_back("registry.path required for the sqlite backend");
                }
                break;
            case DatabaseType::POSTGRESQL:
                if (config.registry.connection_string.empty()) {
                    errors.push_back("registry.connection_string required for the postgresql backend");
                }
                break;
        }
    } catch (const std::exception&) {
        errors.push_back(std::format("registry.backend '{}' is not supported", config.registry.backend));
    }

    if (config.output.directory.empty()) {
        errors.push_back("output.directory must not be empty");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' must be debug, info, warn or error",
            config.logging.level));
    }

    for (size_t i = 0; i < config.recognizers.size(); ++i) {
        const auto& rec = config.recognizers[i];
        if (utils::trim(rec.entity_type).empty()) {
            errors.push_back(std::format("recognizers[{}].entity_type must not be empty", i));
        }
        if (rec.patterns.empty()) {
            errors.push_back(std::format("recognizers[{}].patterns must not be empty", i));
        }
        if (rec.score < 0.0 || rec.score > 1.0) {
            errors.push_back(std::format("recognizers[{}].score must be in [0, 1]", i));
        }
        for (const auto& pattern : rec.patterns) {
            try {
                std::regex re(pattern, std::regex::ECMAScript);
            } catch (const std::regex_error& e) {
                errors.push_back(std::format("recognizers[{}]: invalid pattern '{}': {}", i, pattern, e.what()));
            }
        }
    }

    return errors;
}

} // namespace docanon
