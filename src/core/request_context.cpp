#include "core/request_context.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>

namespace reqtrace {

std::vector<std::string> RequestContext::get_req_header(std::string_view name) const {
    std::vector<std::string> values;
    for (const auto& h : request_headers) {
        if (utils::iequals(h.name, name)) {
            values.push_back(h.value);
        }
    }
    return values;
}

std::optional<std::string> RequestContext::req_header(std::string_view name) const {
    for (const auto& h : request_headers) {
        if (utils::iequals(h.name, name)) {
            return h.value;
        }
    }
    return std::nullopt;
}

void RequestContext::add_req_header(std::string name, std::string value) {
    request_headers.push_back({std::move(name), std::move(value)});
}

void RequestContext::put_resp_header(std::string_view name, std::string value) {
    std::erase_if(response_headers, [name](const HeaderField& h) {
        return utils::iequals(h.name, name);
    });
    response_headers.push_back({utils::to_lower(name), std::move(value)});
}

std::optional<std::string> RequestContext::resp_header(std::string_view name) const {
    for (const auto& h : response_headers) {
        if (utils::iequals(h.name, name)) {
            return h.value;
        }
    }
    return std::nullopt;
}

size_t RequestContext::resp_header_count(std::string_view name) const {
    return static_cast<size_t>(std::count_if(response_headers.begin(), response_headers.end(),
        [name](const HeaderField& h) { return utils::iequals(h.name, name); }));
}

void RequestContext::register_before_send(BeforeSendCallback callback) {
    before_send_.push_back(std::move(callback));
}

void RequestContext::run_before_send() noexcept {
    // Detach first so a callback registering another callback cannot loop
    auto callbacks = std::move(before_send_);
    before_send_.clear();

    for (auto it = callbacks.rbegin(); it != callbacks.rend(); ++it) {
        try {
            (*it)(*this);
        } catch (const std::exception& e) {
            utils::log::error(std::format("before_send callback failed for {} {}: {}",
                method, path, e.what()));
        } catch (...) {
            utils::log::error(std::format("before_send callback failed for {} {}: non-standard exception",
                method, path));
        }
    }
}

} // namespace reqtrace
