#pragma once

#include "core/request_context.hpp"
#include "tracing/span.hpp"
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace reqtrace {

/**
 * @brief Computes one attribute value from a request
 *
 * `args` carries the extra arguments of a RemoteFunctionWithArgs spec and is
 * empty otherwise.
 */
using AttributeFunction =
    std::function<std::string(const RequestContext&, const std::vector<std::string>& args)>;

/**
 * @brief A named set of attribute functions
 *
 * The module embedding the middleware supplies one as the "owner" (target of
 * LocalFunction specs); other modules are looked up by name in an
 * AttributeModuleRegistry.
 */
class AttributeModule {
public:
    explicit AttributeModule(std::string name) : name_(std::move(name)) {}

    /// Define a one-argument function (request only)
    AttributeModule& define(std::string function,
                            std::function<std::string(const RequestContext&)> fn);

    /// Define a function taking the request followed by extra arguments
    AttributeModule& define_with_args(std::string function, AttributeFunction fn);

    /// @return nullptr if the module has no such function
    [[nodiscard]] const AttributeFunction* find(std::string_view function) const;

    [[nodiscard]] const std::string& name() const { return name_; }

private:
    std::string name_;
    std::unordered_map<std::string, AttributeFunction> functions_;
};

class AttributeModuleRegistry {
public:
    /// Name of the built-in module exposing request fields
    static constexpr std::string_view kRequestModule = "request";

    void register_module(std::shared_ptr<const AttributeModule> module);

    /// @return nullptr if no module is registered under that name
    [[nodiscard]] std::shared_ptr<const AttributeModule> find(std::string_view name) const;

    /**
     * @brief Registry preloaded with the "request" module:
     * method, path, query_string, host, remote_addr, request_id, user_agent,
     * header(name), query_param(name)
     */
    [[nodiscard]] static AttributeModuleRegistry with_builtins();

private:
    std::unordered_map<std::string, std::shared_ptr<const AttributeModule>> modules_;
};

/**
 * @brief How to compute one named span attribute
 *
 * - LOCAL_FUNCTION:            owner.function(request), key = function
 * - REMOTE_FUNCTION:           module.function(request), key = function
 * - REMOTE_FUNCTION_WITH_ARGS: module.function(request, args...), key = function
 */
struct AttributeSpec {
    enum class Kind { LOCAL_FUNCTION, REMOTE_FUNCTION, REMOTE_FUNCTION_WITH_ARGS };

    Kind kind = Kind::LOCAL_FUNCTION;
    std::string module;               // Empty for LOCAL_FUNCTION
    std::string function;
    std::vector<std::string> args;    // Only for REMOTE_FUNCTION_WITH_ARGS

    [[nodiscard]] static AttributeSpec local(std::string function);
    [[nodiscard]] static AttributeSpec remote(std::string module, std::string function);
    [[nodiscard]] static AttributeSpec remote_with_args(std::string module, std::string function,
                                                        std::vector<std::string> args);

    /// Attribute key produced by this spec
    [[nodiscard]] const std::string& key() const { return function; }
};

/**
 * @brief Resolves a fixed, ordered list of AttributeSpecs against a request
 *
 * All specs are bound to their functions at construction; an unknown module
 * or function is a configuration error (std::invalid_argument). Exceptions
 * thrown by attribute functions during resolve() propagate unchanged.
 */
class AttributeResolver {
public:
    AttributeResolver() = default;

    AttributeResolver(std::vector<AttributeSpec> specs,
                      std::shared_ptr<const AttributeModule> owner,
                      const AttributeModuleRegistry& registry);

    /// Evaluate every spec in declaration order
    [[nodiscard]] AttributeMap resolve(const RequestContext& request) const;

    [[nodiscard]] size_t size() const { return bound_.size(); }
    [[nodiscard]] bool empty() const { return bound_.empty(); }

private:
    struct BoundSpec {
        AttributeSpec spec;
        AttributeFunction fn;
    };

    std::vector<BoundSpec> bound_;
};

} // namespace reqtrace
