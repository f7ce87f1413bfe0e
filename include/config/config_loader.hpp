#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace reqtrace {

// ============================================================================
// ServiceConfig - Complete parsed configuration
// ============================================================================

struct ServiceConfig {
    ServerConfig server;
    LoggingConfig logging;
    TracingConfig tracing;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads ServiceConfig from TOML
 *
 * Supports `include = "other.toml"` (or an array of paths, relative to the
 * including file; the including file wins on conflicts) and ${ENV_VAR}
 * substitution in string values.
 *
 * Attribute specs under [tracing]:
 *   attributes = ["method"]                  # local functions
 *   [[tracing.attributes]]
 *   function = "method"                      # local function
 *   [[tracing.attributes]]
 *   module = "request"
 *   function = "header"
 *   args = ["user-agent"]                    # remote function with args
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ServiceConfig config;

        static LoadResult ok(ServiceConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to reqtrace.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Validate a config, returning every problem found (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const ServiceConfig& config);

private:
    static ServiceConfig extract_all_sections(const toml::table& root);
    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static TracingConfig extract_tracing(const toml::table& root);
    static AttributeSpec extract_attribute(const toml::node& node, size_t index);
    static LoadResult validate_and_return(ServiceConfig config);
};

} // namespace reqtrace
