#include "tracing/attribute_resolver.hpp"
#include <format>
#include <stdexcept>

namespace reqtrace {

namespace {

const std::string& require_arg(const std::vector<std::string>& args, std::string_view function) {
    if (args.empty()) {
        throw std::invalid_argument(
            std::format("request.{} requires one argument", function));
    }
    return args.front();
}

std::shared_ptr<const AttributeModule> make_request_module() {
    auto m = std::make_shared<AttributeModule>(std::string(AttributeModuleRegistry::kRequestModule));

    m->define("method", [](const RequestContext& r) { return r.method; });
    m->define("path", [](const RequestContext& r) { return r.path; });
    m->define("query_string", [](const RequestContext& r) { return r.query_string; });
    m->define("host", [](const RequestContext& r) { return r.host; });
    m->define("remote_addr", [](const RequestContext& r) { return r.remote_addr; });
    m->define("request_id", [](const RequestContext& r) { return r.request_id; });
    m->define("user_agent", [](const RequestContext& r) {
        return r.req_header("user-agent").value_or("");
    });
    m->define_with_args("header",
        [](const RequestContext& r, const std::vector<std::string>& args) {
            return r.req_header(require_arg(args, "header")).value_or("");
        });
    m->define_with_args("query_param",
        [](const RequestContext& r, const std::vector<std::string>& args) {
            const auto it = r.query_params.find(require_arg(args, "query_param"));
            return it != r.query_params.end() ? it->second : std::string{};
        });

    return m;
}

} // anonymous namespace

// ============================================================================
// AttributeModule
// ============================================================================

AttributeModule& AttributeModule::define(std::string function,
                                         std::function<std::string(const RequestContext&)> fn) {
    functions_.insert_or_assign(std::move(function),
        [fn = std::move(fn)](const RequestContext& r, const std::vector<std::string>&) {
            return fn(r);
        });
    return *this;
}

AttributeModule& AttributeModule::define_with_args(std::string function, AttributeFunction fn) {
    functions_.insert_or_assign(std::move(function), std::move(fn));
    return *this;
}

const AttributeFunction* AttributeModule::find(std::string_view function) const {
    const auto it = functions_.find(std::string(function));
    return it != functions_.end() ? &it->second : nullptr;
}

// ============================================================================
// AttributeModuleRegistry
// ============================================================================

void AttributeModuleRegistry::register_module(std::shared_ptr<const AttributeModule> module) {
    if (!module) {
        throw std::invalid_argument("Cannot register a null attribute module");
    }
    const std::string name = module->name();
    modules_.insert_or_assign(name, std::move(module));
}

std::shared_ptr<const AttributeModule> AttributeModuleRegistry::find(std::string_view name) const {
    const auto it = modules_.find(std::string(name));
    return it != modules_.end() ? it->second : nullptr;
}

AttributeModuleRegistry AttributeModuleRegistry::with_builtins() {
    AttributeModuleRegistry registry;
    registry.register_module(make_request_module());
    return registry;
}

// ============================================================================
// AttributeSpec
// ============================================================================

AttributeSpec AttributeSpec::local(std::string function) {
    AttributeSpec spec;
    spec.kind = Kind::LOCAL_FUNCTION;
    spec.function = std::move(function);
    return spec;
}

AttributeSpec AttributeSpec::remote(std::string module, std::string function) {
    AttributeSpec spec;
    spec.kind = Kind::REMOTE_FUNCTION;
    spec.module = std::move(module);
    spec.function = std::move(function);
    return spec;
}

AttributeSpec AttributeSpec::remote_with_args(std::string module, std::string function,
                                              std::vector<std::string> args) {
    AttributeSpec spec;
    spec.kind = Kind::REMOTE_FUNCTION_WITH_ARGS;
    spec.module = std::move(module);
    spec.function = std::move(function);
    spec.args = std::move(args);
    return spec;
}

// ============================================================================
// AttributeResolver
// ============================================================================

AttributeResolver::AttributeResolver(std::vector<AttributeSpec> specs,
                                     std::shared_ptr<const AttributeModule> owner,
                                     const AttributeModuleRegistry& registry) {
    bound_.reserve(specs.size());

    for (auto& spec : specs) {
        std::shared_ptr<const AttributeModule> module;
        if (spec.kind == AttributeSpec::Kind::LOCAL_FUNCTION) {
            if (!owner) {
                throw std::invalid_argument(std::format(
                    "Attribute '{}' refers to a local function but no owner module is set",
                    spec.function));
            }
            module = owner;
        } else {
            module = registry.find(spec.module);
            if (!module) {
                throw std::invalid_argument(std::format(
                    "Attribute '{}' refers to unknown module '{}'", spec.function, spec.module));
            }
        }

        const AttributeFunction* fn = module->find(spec.function);
        if (!fn) {
            throw std::invalid_argument(std::format(
                "Attribute module '{}' has no function '{}'", module->name(), spec.function));
        }

        bound_.push_back({std::move(spec), *fn});
    }
}

AttributeMap AttributeResolver::resolve(const RequestContext& request) const {
    static const std::vector<std::string> kNoArgs;

    AttributeMap attributes;
    for (const auto& b : bound_) {
        const auto& args = (b.spec.kind == AttributeSpec::Kind::REMOTE_FUNCTION_WITH_ARGS)
            ? b.spec.args : kNoArgs;
        attributes.insert_or_assign(b.spec.key(), b.fn(request, args));
    }
    return attributes;
}

} // namespace reqtrace
