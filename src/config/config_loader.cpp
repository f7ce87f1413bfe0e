#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace reqtrace {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
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
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (auto&& [key, val] : overlay) {
        if (val.is_table() && base.contains(key.str()) && base[key.str()].is_table()) {
            merge_tables(*base[key.str()].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key.str()) && base[key.str()].is_array()) {
            auto& base_arr = *base[key.str()].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10 (circular include?)");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Merge: included is base, root is overlay (main wins)
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);

    const int64_t port = s["port"].value_or(int64_t{8080});
    if (!utils::in_range<1, 65535>(port)) {
        throw std::runtime_error(std::format("server.port must be 1-65535, got {}", port));
    }
    cfg.port = static_cast<uint16_t>(port);

    const int64_t threads = s["threads"].value_or(int64_t{4});
    if (threads <= 0) {
        throw std::runtime_error(std::format("server.threads must be > 0, got {}", threads));
    }
    cfg.thread_pool_size = static_cast<size_t>(threads);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

AttributeSpec ConfigLoader::extract_attribute(const toml::node& node, size_t index) {
    // Bare string: local function of the embedding module
    if (const auto* name = node.as_string()) {
        return AttributeSpec::local(name->get());
    }

    const auto* tbl = node.as_table();
    if (!tbl) {
        throw std::runtime_error(std::format(
            "tracing.attributes[{}] must be a string or a table", index));
    }
    const auto& t = *tbl;

    const std::string function = t["function"].value_or(""s);
    if (function.empty()) {
        throw std::runtime_error(std::format(
            "tracing.attributes[{}].function must not be empty", index));
    }

    const std::string module = t["module"].value_or(""s);
    const bool has_args = static_cast<bool>(t["args"]);

    if (module.empty()) {
        if (has_args) {
            throw std::runtime_error(std::format(
                "tracing.attributes[{}]: args require a module", index));
        }
        return AttributeSpec::local(function);
    }
    if (has_args) {
        if (!t["args"].is_array()) {
            throw std::runtime_error(std::format(
                "tracing.attributes[{}].args must be an array of strings", index));
        }
        return AttributeSpec::remote_with_args(module, function, toml_string_array(t, "args"));
    }
    return AttributeSpec::remote(module, function);
}

TracingConfig ConfigLoader::extract_tracing(const toml::table& root) {
    TracingConfig cfg;
    const auto* tracing = root["tracing"].as_table();
    if (!tracing) return cfg;
    const auto& t = *tracing;

    cfg.enabled = t["enabled"].value_or(true);
    cfg.log_spans = t["log_spans"].value_or(true);
    cfg.spans_endpoint = t["spans_endpoint"].value_or(false);

    const int64_t max_spans = t["max_finished_spans"].value_or(int64_t{1024});
    if (max_spans <= 0) {
        throw std::runtime_error(std::format(
            "tracing.max_finished_spans must be > 0, got {}", max_spans));
    }
    cfg.max_finished_spans = static_cast<size_t>(max_spans);

    if (const auto* arr = t["attributes"].as_array()) {
        cfg.attributes.reserve(arr->size());
        for (size_t i = 0; i < arr->size(); ++i) {
            cfg.attributes.push_back(extract_attribute(*arr->get(i), i));
        }
    }
    return cfg;
}

ServiceConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    ServiceConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.tracing = extract_tracing(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ServiceConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

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

std::vector<std::string> ConfigLoader::validate_config(const ServiceConfig& config) {
    std::vector<std::string> errors;

    if (config.server.host.empty()) {
        errors.push_back("server.host must not be empty");
    }
    if (config.server.port == 0) {
        errors.push_back("server.port must be 1-65535, got 0");
    }
    if (config.server.thread_pool_size == 0) {
        errors.push_back("server.threads must be > 0");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error; got '{}'",
            config.logging.level));
    }

    if (config.tracing.max_finished_spans == 0) {
        errors.push_back("tracing.max_finished_spans must be > 0");
    }

    for (size_t i = 0; i < config.tracing.attributes.size(); ++i) {
        const auto& spec = config.tracing.attributes[i];
        if (spec.function.empty()) {
            errors.push_back(std::format("tracing.attributes[{}].function must not be empty", i));
        }
        if (spec.kind != AttributeSpec::Kind::LOCAL_FUNCTION && spec.module.empty()) {
            errors.push_back(std::format("tracing.attributes[{}].module must not be empty", i));
        }
    }

    return errors;
}

} // namespace reqtrace
