#pragma once

// Plugin ABI (v1).
//
// A plugin is a prism::Plugin subclass. The loader obtains instances either
// from the in-process PluginFactoryRegistry (manifest entry "builtin:<id>")
// or from a shared library exporting the C entry points below
// (PRISM_DECLARE_PLUGIN generates them). Shared-library plugins link
// against libprism_core so that they share the host's interception state.

#include "prism/manifest.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Plugins must export prism_plugin_abi_version() returning this value.
#define PRISM_ABI_VERSION 1

namespace prism {

class RequestContext;

enum class StepResult {
    Continue,   // hand control to the next step
    Stop,       // end the chain here (nothing after this step runs)
};

class Plugin {
public:
    virtual ~Plugin();

    // Called once after the plugin's grants and root are registered, under
    // the plugin's PluginScope. Throwing aborts the load.
    virtual void initialize() {}
    virtual void shutdown() {}

    // One chain step.
    virtual StepResult handle(RequestContext& ctx) = 0;

    virtual bool is_meta() const { return false; }
};

// Group plugin owning sub-plugins and named preset chains. The loader fills
// both in after the group's own initialize() has run.
class MetaPlugin : public Plugin {
public:
    ~MetaPlugin() override;

    StepResult handle(RequestContext&) override { return StepResult::Continue; }
    bool is_meta() const override { return true; }

    std::shared_ptr<Plugin> subplugin(const std::string& name) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = subplugins_.find(name);
        return it == subplugins_.end() ? nullptr : it->second;
    }

    std::vector<std::string> subplugin_names() const {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<std::string> out;
        for (const auto& kv : subplugins_) out.push_back(kv.first);
        return out;
    }

    // Keys are "<meta>:<chain>".
    std::optional<PresetChain> chain(const std::string& full_name) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = chains_.find(full_name);
        if (it == chains_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<std::string> chain_names() const {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<std::string> out;
        for (const auto& kv : chains_) out.push_back(kv.first);
        return out;
    }

    void attach_subplugin(const std::string& name, std::shared_ptr<Plugin> p) {
        std::lock_guard<std::mutex> lk(mu_);
        subplugins_[name] = std::move(p);
    }

    void set_chains(std::map<std::string, PresetChain> chains) {
        std::lock_guard<std::mutex> lk(mu_);
        chains_ = std::move(chains);
    }

    // Returns the detached sub-plugins so the caller can shut them down.
    std::map<std::string, std::shared_ptr<Plugin>> detach_subplugins() {
        std::lock_guard<std::mutex> lk(mu_);
        std::map<std::string, std::shared_ptr<Plugin>> out;
        out.swap(subplugins_);
        return out;
    }

private:
    mutable std::mutex mu_;
    std::map<std::string, std::shared_ptr<Plugin>> subplugins_;
    std::map<std::string, PresetChain> chains_;
};

using PluginFactory = std::function<std::unique_ptr<Plugin>()>;

// Typed registry for plugins compiled into the host.
class PluginFactoryRegistry {
public:
    static PluginFactoryRegistry& instance();

    // Throws ConfigurationError on duplicate id.
    void register_factory(const std::string& id, PluginFactory factory);
    void unregister_factory(const std::string& id);

    // nullptr if id is unknown.
    std::unique_ptr<Plugin> create(const std::string& id) const;
    bool contains(const std::string& id) const;

private:
    mutable std::mutex mu_;
    std::map<std::string, PluginFactory> factories_;
};

// Static-initialization helper: `static PluginRegistration<MyPlugin> reg("my_plugin");`
template <typename T>
struct PluginRegistration {
    explicit PluginRegistration(const std::string& id) {
        PluginFactoryRegistry::instance().register_factory(id, [] { return std::unique_ptr<Plugin>(new T()); });
    }
};

} // namespace prism

extern "C" {
    typedef int (*prism_plugin_abi_version_fn)();
    typedef prism::Plugin* (*prism_plugin_create_fn)();
    typedef void (*prism_plugin_destroy_fn)(prism::Plugin*);
}

// Exports the three C entry points for a shared-library plugin class.
#define PRISM_DECLARE_PLUGIN(PluginClass)                                              \
    extern "C" int prism_plugin_abi_version() { return PRISM_ABI_VERSION; }           \
    extern "C" prism::Plugin* prism_plugin_create() { return new PluginClass(); }     \
    extern "C" void prism_plugin_destroy(prism::Plugin* p) { delete p; }
