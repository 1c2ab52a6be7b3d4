#pragma once

#include "prism/json_mini.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace prism {

// Mutable carrier for one chain run. Never shared between runs.
class RequestContext {
public:
    RequestContext(std::string route, json_mini::Doc request);

    RequestContext(RequestContext&&) = default;
    RequestContext& operator=(RequestContext&&) = default;

    const std::string& route() const { return route_; }

    // Both are always JSON objects (never null). Borrowed pointers.
    json_object* request_data() const { return request_.root; }
    json_object* response_data() const { return response_.root; }
    // Throws std::invalid_argument unless `d` holds an object.
    void set_response_data(json_mini::Doc d);

    // Shared state visible to every later step of the same run.
    void set(const std::string& key, json_mini::Doc value);
    void set_string(const std::string& key, const std::string& value);
    json_object* get(const std::string& key) const;    // nullptr if absent
    std::optional<std::string> get_string(const std::string& key) const;
    bool has(const std::string& key) const { return shared_.count(key) != 0; }

    const std::optional<std::string>& user_id() const { return user_id_; }
    void set_user_id(std::string id) { user_id_ = std::move(id); }

    const std::string& current_plugin() const { return current_plugin_; }
    void set_current_plugin(std::string name) { current_plugin_ = std::move(name); }

    // One-way: once set it cannot be cleared.
    bool is_short_circuited() const { return short_circuited_; }
    void mark_short_circuited() { short_circuited_ = true; }

    // response_data = {"success": true, "content": content}
    void respond(json_mini::Doc content);
    void respond_text(const std::string& content);
    // response_data = {"success": false, "error": message, "code": code}
    void error(const std::string& message, const std::string& code = "error", bool short_circuit = true);
    void short_circuit(const std::string& reason, const std::string& code = "short_circuit");

    // Appends {"plugin", "error"} to response_data["errors"].
    void add_error(const std::string& plugin, const std::string& message);
    std::vector<std::pair<std::string, std::string>> errors() const;

    void enable_trace();
    bool tracing() const { return trace_ != nullptr; }
    // "[<monotonic seconds, 4 decimals>] message"; ignored when tracing is off.
    void add_trace(const std::string& message);
    // Builds the message only when tracing is on.
    template <typename MakeMessage>
    void trace(MakeMessage&& make) {
        if (trace_) add_trace(make());
    }
    // nullptr when tracing is off.
    const std::vector<std::string>* trace_log() const { return trace_.get(); }

private:
    std::string route_;
    json_mini::Doc request_;
    json_mini::Doc response_;
    std::map<std::string, json_mini::Doc> shared_;
    std::optional<std::string> user_id_;
    std::string current_plugin_;
    bool short_circuited_{false};
    std::unique_ptr<std::vector<std::string>> trace_;
};

} // namespace prism
