#include "prism/chain_runner.h"
#include "prism/errors.h"
#include "prism/interception.h"
#include "prism/manifest.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace prism {

namespace {

std::string list_str(const std::vector<std::string>& v) {
    std::string s = "[";
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) s += ", ";
        s += v[i];
    }
    return s + "]";
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

json_mini::Doc error_response(const std::string& message) {
    json_mini::Doc d = json_mini::Doc::object();
    json_mini::put_string(d.root, "error", message);
    return d;
}

std::vector<std::string> parse_chain_entries(const std::string& route, json_object* arr) {
    if (!arr || !json_object_is_type(arr, json_type_array)) {
        throw ConfigurationError("route " + route + ": chain must be a list");
    }
    std::vector<std::string> out;
    const size_t n = json_object_array_length(arr);
    for (size_t i = 0; i < n; ++i) {
        json_object* e = json_object_array_get_idx(arr, i);
        if (e && json_object_is_type(e, json_type_string)) {
            out.emplace_back(json_object_get_string(e));
            continue;
        }
        auto plugin = json_mini::string_at(e, "plugin");
        if (!plugin || plugin->empty()) {
            throw ConfigurationError("route " + route + ": invalid chain entry at index " + std::to_string(i));
        }
        out.push_back(*plugin);
    }
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// ChainRef
// ---------------------------------------------------------------------------

ChainRef parse_chain_ref(const std::string& ref) {
    auto colon = ref.find(':');
    if (colon != std::string::npos) return PresetRef{ref.substr(0, colon), ref.substr(colon + 1)};
    auto dot = ref.find('.');
    if (dot != std::string::npos) return SubPluginRef{ref.substr(0, dot), ref.substr(dot + 1)};
    return PlainRef{ref};
}

std::string to_string(const ChainRef& ref) {
    if (const auto* p = std::get_if<PlainRef>(&ref)) return p->name;
    if (const auto* s = std::get_if<SubPluginRef>(&ref)) return s->meta + "." + s->sub;
    const auto& c = std::get<PresetRef>(ref);
    return c.meta + ":" + c.chain;
}

// ---------------------------------------------------------------------------
// RouteTable
// ---------------------------------------------------------------------------

void RouteTable::set_route(const std::string& route, std::vector<std::string> chain) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        routes_[route] = std::move(chain);
    }
    notify();
}

bool RouteTable::remove_route(const std::string& route) {
    bool erased;
    {
        std::lock_guard<std::mutex> lk(mu_);
        erased = routes_.erase(route) != 0;
    }
    if (erased) notify();
    return erased;
}

void RouteTable::clear() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        routes_.clear();
    }
    notify();
}

void RouteTable::load_file(const std::filesystem::path& path) {
    json_mini::Doc doc = load_structured_file(path);
    json_object* routes = json_mini::member(doc.root, "routes");
    if (!routes || !json_object_is_type(routes, json_type_object)) {
        throw ConfigurationError(path.string() + ": missing 'routes' object");
    }

    std::map<std::string, std::vector<std::string>> next;
    json_object_object_foreach(routes, k, v) {
        json_object* chain = json_object_is_type(v, json_type_array) ? v : json_mini::member(v, "chain");
        next[k] = parse_chain_entries(k, chain);
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        routes_.swap(next);
    }
    std::cerr << "[routes] loaded " << path.string() << "\n";
    notify();
}

std::optional<std::vector<std::string>> RouteTable::chain_for(const std::string& route) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = routes_.find(route);
    if (it == routes_.end()) return std::nullopt;
    return it->second;
}

std::map<std::string, std::vector<std::string>> RouteTable::routes() const {
    std::lock_guard<std::mutex> lk(mu_);
    return routes_;
}

int RouteTable::add_change_listener(std::function<void()> fn) {
    std::lock_guard<std::mutex> lk(mu_);
    int id = next_listener_++;
    listeners_[id] = std::move(fn);
    return id;
}

void RouteTable::remove_change_listener(int id) {
    std::lock_guard<std::mutex> lk(mu_);
    listeners_.erase(id);
}

void RouteTable::notify() {
    std::vector<std::function<void()>> fns;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& kv : listeners_) fns.push_back(kv.second);
    }
    for (auto& fn : fns) fn();
}

// ---------------------------------------------------------------------------
// ChainRunner
// ---------------------------------------------------------------------------

ChainRunner::ChainRunner(const IPluginDirectory& plugins, RouteTable& routes)
    : plugins_(plugins), routes_(routes) {
    routes_listener_ = routes_.add_change_listener([this]() { clear_cache(); });
}

ChainRunner::~ChainRunner() {
    routes_.remove_change_listener(routes_listener_);
}

void ChainRunner::set_default_plugin(std::string name) {
    std::lock_guard<std::mutex> lk(mu_);
    default_plugin_ = std::move(name);
}

void ChainRunner::clear_cache() {
    std::lock_guard<std::mutex> lk(mu_);
    cache_.clear();
    ++cache_generation_;
}

std::vector<std::string> ChainRunner::get_chain_for_route(const std::string& route, RequestContext* ctx) {
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lk(mu_);
        generation = cache_generation_;
        auto it = cache_.find(route);
        if (it != cache_.end()) {
            if (ctx) ctx->trace([&] { return "Chain for route '" + route + "' found in cache: " + list_str(it->second); });
            return it->second;
        }
    }
    if (ctx) ctx->trace([&] { return "Chain for route '" + route + "' not in cache, resolving from configuration"; });

    auto configured = routes_.chain_for(route);
    std::vector<std::string> chain = configured ? *configured : std::vector<std::string>{};
    if (ctx) ctx->trace([&] { return "Initial chain from config: " + list_str(chain); });

    // an unconfigured "meta:chain" route addresses a preset directly
    if (!configured && route.find(':') != std::string::npos) {
        std::string key = route;
        key.erase(0, key.find_first_not_of('/'));
        auto ref = parse_chain_ref(key);
        if (const auto* preset = std::get_if<PresetRef>(&ref)) {
            auto meta = std::dynamic_pointer_cast<MetaPlugin>(plugins_.find(preset->meta));
            if (meta) {
                if (auto def = meta->chain(key)) {
                    if (ctx) ctx->trace([&] { return "Preset chain '" + key + "' resolved via meta-plugin"; });
                    chain = def->plugins;
                }
            }
        }
    }

    std::vector<std::string> expanded;
    for (const auto& entry : chain) {
        auto ref = parse_chain_ref(entry);
        if (const auto* preset = std::get_if<PresetRef>(&ref)) {
            auto meta = std::dynamic_pointer_cast<MetaPlugin>(plugins_.find(preset->meta));
            std::optional<PresetChain> def;
            if (meta) def = meta->chain(entry);
            if (def) {
                if (ctx) ctx->trace([&] { return "Expanding preset chain '" + entry + "' to " + list_str(def->plugins); });
                for (const auto& item : def->plugins) {
                    if (item == kNextPlaceholder) {
                        if (ctx) ctx->trace([] { return "  -> Skipping '" + std::string(kNextPlaceholder) + "' placeholder"; });
                        continue;
                    }
                    expanded.push_back(item);
                }
                continue;
            }
        }
        if (ctx) ctx->trace([&] { return "Adding plugin ref '" + entry + "' to chain"; });
        expanded.push_back(entry);
    }

    bool stored = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        // a clear_cache() since the lookup may have made this expansion stale
        if (cache_generation_ == generation) {
            cache_[route] = expanded;
            stored = true;
        }
    }
    if (ctx) {
        ctx->trace([&] {
            return std::string(stored ? "Resolved and cached" : "Resolved (cache invalidated meanwhile)") +
                   " final chain for route '" + route + "': " + list_str(expanded);
        });
    }
    return expanded;
}

std::shared_ptr<Plugin> ChainRunner::resolve(const std::string& ref, RequestContext* ctx) const {
    ChainRef parsed = parse_chain_ref(ref);

    if (const auto* plain = std::get_if<PlainRef>(&parsed)) {
        if (ctx) ctx->trace([&] { return "Resolving plugin reference: '" + ref + "'"; });
        auto p = plugins_.find(plain->name);
        if (!p) throw std::out_of_range("Plugin '" + plain->name + "' not found");
        return p;
    }
    if (const auto* sub = std::get_if<SubPluginRef>(&parsed)) {
        if (ctx) ctx->trace([&] { return "Resolving sub-plugin reference: '" + ref + "'"; });
        auto owner = plugins_.find(sub->meta);
        if (!owner) throw std::out_of_range("Meta plugin '" + sub->meta + "' not found");
        auto* meta = dynamic_cast<MetaPlugin*>(owner.get());
        if (!meta) throw std::out_of_range("Plugin '" + sub->meta + "' is not a meta plugin");
        auto p = meta->subplugin(sub->sub);
        if (!p) throw std::out_of_range("Subplugin '" + sub->sub + "' not found in '" + sub->meta + "'");
        if (ctx) ctx->trace([&] { return "  -> Resolved to sub-plugin: '" + sub->sub + "'"; });
        return p;
    }
    // presets that survive expansion name no loaded chain
    throw std::out_of_range("Preset chain '" + ref + "' not found");
}

std::vector<std::string> ChainRunner::default_chain() const {
    std::string name;
    {
        std::lock_guard<std::mutex> lk(mu_);
        name = default_plugin_;
    }
    if (name.empty() || !plugins_.find(name)) return {};
    return {name};
}

RequestContext ChainRunner::run(const std::string& route, json_mini::Doc request) {
    RequestContext ctx(route, std::move(request));
    if (json_mini::truthy(json_mini::member(ctx.request_data(), "_trace"))) {
        ctx.enable_trace();
        auto rid = json_mini::string_at(ctx.request_data(), "request_id");
        ctx.add_trace("Execution trace enabled for request_id: " + rid.value_or("none"));
    }

    std::vector<std::string> chain = get_chain_for_route(route, &ctx);
    if (chain.empty()) {
        ctx.add_trace("No plugin chain configured for route, attempting to find default");
        chain = default_chain();
        if (chain.empty()) {
            std::cerr << "[warn] chain: no chain configured and no default for route " << route << "\n";
            ctx.add_trace("No default chain available. Aborting");
            ctx.set_response_data(error_response("No handlers configured for route: " + route));
            return ctx;
        }
        ctx.trace([&] { return "Using default chain: " + list_str(chain); });
    }

    // every reference must resolve before any step runs
    ctx.add_trace("Validating plugins in chain...");
    std::vector<std::string> missing;
    for (const auto& ref : chain) {
        try {
            resolve(ref, &ctx);
        } catch (const std::out_of_range& e) {
            missing.push_back(ref + ": " + e.what());
        }
    }
    if (!missing.empty()) {
        const std::string msg = "Missing or invalid plugins for route " + route + ": " + list_str(missing);
        std::cerr << "[error] chain: " << msg << "\n";
        ctx.trace([&] { return "Validation failed: " + msg; });
        ctx.set_response_data(error_response(msg));
        return ctx;
    }
    ctx.add_trace("All plugins in chain are valid");

    if (json_object* uid = json_mini::member(ctx.request_data(), "user_id")) {
        if (json_mini::truthy(uid)) ctx.set_user_id(json_object_get_string(uid));
    }

    size_t i = 0;
    for (; i < chain.size(); ++i) {
        if (ctx.is_short_circuited()) {
            ctx.trace([&] { return "Chain short-circuited at index " + std::to_string(i) + ". Halting execution"; });
            break;
        }
        const std::string& ref = chain[i];
        ctx.set_current_plugin(ref);
        ctx.trace([&] { return "Executing plugin at index " + std::to_string(i) + ": '" + ref + "'"; });

        StepResult result = StepResult::Continue;
        std::string failure;
        try {
            auto plugin = resolve(ref, &ctx);
            PluginScope scope(ref);
            result = plugin->handle(ctx);
        } catch (const std::exception& e) {
            failure = e.what();
        } catch (...) {
            failure = "unknown exception";
        }
        if (!failure.empty()) {
            std::cerr << "[warn] chain: plugin " << ref << " failed on " << route << ": " << failure << "\n";
            ctx.trace([&] { return "Plugin '" + ref + "' execution FAILED: " + failure; });
            ctx.add_error(ref, failure);
            ctx.mark_short_circuited();
            ++i;
            break;
        }
        ctx.trace([&] { return "Plugin '" + ref + "' execution finished successfully"; });
        if (result == StepResult::Stop) {
            ctx.trace([&] { return "Plugin '" + ref + "' did not continue; chain ends here"; });
            ++i;
            break;
        }
    }
    if (i >= chain.size() && !ctx.is_short_circuited()) ctx.add_trace("Reached end of chain");
    ctx.add_trace("Plugin chain execution finished");

    if (const auto* log = ctx.trace_log()) {
        json_object* arr = json_object_new_array();
        for (const auto& line : *log) json_object_array_add(arr, json_object_new_string(line.c_str()));
        json_object_object_add(ctx.response_data(), "_trace", arr);
    }
    return ctx;
}

ChainValidation ChainRunner::validate_chain(const std::string& route) {
    ChainValidation v;
    v.route = route;
    v.chain = get_chain_for_route(route);
    if (v.chain.empty()) {
        v.valid = false;
        v.issues.push_back("No plugin chain configured");
        return v;
    }
    for (const auto& ref : v.chain) {
        try {
            resolve(ref);
        } catch (const std::out_of_range& e) {
            v.valid = false;
            v.issues.push_back(e.what());
        }
    }

    // advisory only: chains normally end in a provider
    const std::string& last = v.chain.back();
    if (plugins_.find(last)) {
        auto type = plugins_.plugin_type(last);
        if (lower(last).find("provider") == std::string::npos && (!type || lower(*type) != "provider")) {
            v.issues.push_back("Last plugin '" + last + "' might not be a provider plugin");
        }
    }
    std::cerr << "[chain] validated " << route << ": " << (v.valid ? "valid" : "invalid")
              << " issues=" << v.issues.size() << "\n";
    return v;
}

} // namespace prism
