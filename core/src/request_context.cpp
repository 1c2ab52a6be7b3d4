#include "prism/request_context.h"

#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace prism {

RequestContext::RequestContext(std::string route, json_mini::Doc request)
    : route_(std::move(route)), request_(std::move(request)), response_(json_mini::Doc::object()) {
    if (!request_ || !json_object_is_type(request_.root, json_type_object)) {
        request_ = json_mini::Doc::object();
    }
}

void RequestContext::set_response_data(json_mini::Doc d) {
    if (!d || !json_object_is_type(d.root, json_type_object)) {
        throw std::invalid_argument("response_data must be a JSON object");
    }
    response_ = std::move(d);
}

void RequestContext::set(const std::string& key, json_mini::Doc value) {
    shared_[key] = std::move(value);
}

void RequestContext::set_string(const std::string& key, const std::string& value) {
    shared_[key] = json_mini::Doc{json_object_new_string_len(value.c_str(), static_cast<int>(value.size()))};
}

json_object* RequestContext::get(const std::string& key) const {
    auto it = shared_.find(key);
    return it == shared_.end() ? nullptr : it->second.root;
}

std::optional<std::string> RequestContext::get_string(const std::string& key) const {
    json_object* v = get(key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v));
}

void RequestContext::respond(json_mini::Doc content) {
    json_mini::Doc r = json_mini::Doc::object();
    json_object_object_add(r.root, "success", json_object_new_boolean(1));
    if (content) json_object_object_add(r.root, "content", content.release());
    response_ = std::move(r);
}

void RequestContext::respond_text(const std::string& content) {
    respond(json_mini::Doc{json_object_new_string_len(content.c_str(), static_cast<int>(content.size()))});
}

void RequestContext::error(const std::string& message, const std::string& code, bool short_circuit) {
    json_mini::Doc r = json_mini::Doc::object();
    json_object_object_add(r.root, "success", json_object_new_boolean(0));
    json_mini::put_string(r.root, "error", message);
    json_mini::put_string(r.root, "code", code);
    response_ = std::move(r);
    if (short_circuit) short_circuited_ = true;
}

void RequestContext::short_circuit(const std::string& reason, const std::string& code) {
    error(reason, code, true);
}

void RequestContext::add_error(const std::string& plugin, const std::string& message) {
    json_object* errs = json_mini::member(response_.root, "errors");
    if (!errs || !json_object_is_type(errs, json_type_array)) {
        errs = json_object_new_array();
        json_object_object_add(response_.root, "errors", errs);
    }
    json_object* e = json_object_new_object();
    json_mini::put_string(e, "plugin", plugin);
    json_mini::put_string(e, "error", message);
    json_object_array_add(errs, e);
}

std::vector<std::pair<std::string, std::string>> RequestContext::errors() const {
    std::vector<std::pair<std::string, std::string>> out;
    json_object* errs = json_mini::member(response_.root, "errors");
    if (!errs || !json_object_is_type(errs, json_type_array)) return out;
    const size_t n = json_object_array_length(errs);
    for (size_t i = 0; i < n; i++) {
        json_object* e = json_object_array_get_idx(errs, i);
        out.emplace_back(json_mini::string_at(e, "plugin").value_or(""),
                         json_mini::string_at(e, "error").value_or(""));
    }
    return out;
}

void RequestContext::enable_trace() {
    if (!trace_) trace_ = std::make_unique<std::vector<std::string>>();
}

void RequestContext::add_trace(const std::string& message) {
    if (!trace_) return;
    const double secs = std::chrono::duration<double>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
    char stamp[32];
    std::snprintf(stamp, sizeof(stamp), "[%.4f] ", secs);
    trace_->push_back(stamp + message);
}

} // namespace prism
