#include "prism/plugin_api.h"
#include "prism/errors.h"

namespace prism {

// Out of line so the vtables and type_info live in libprism_core.
Plugin::~Plugin() = default;
MetaPlugin::~MetaPlugin() = default;

PluginFactoryRegistry& PluginFactoryRegistry::instance() {
    static PluginFactoryRegistry reg;
    return reg;
}

void PluginFactoryRegistry::register_factory(const std::string& id, PluginFactory factory) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!factory) throw ConfigurationError("null plugin factory: " + id);
    if (!factories_.emplace(id, std::move(factory)).second) {
        throw ConfigurationError("duplicate plugin factory: " + id);
    }
}

void PluginFactoryRegistry::unregister_factory(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu_);
    factories_.erase(id);
}

std::unique_ptr<Plugin> PluginFactoryRegistry::create(const std::string& id) const {
    PluginFactory f;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = factories_.find(id);
        if (it == factories_.end()) return nullptr;
        f = it->second;
    }
    return f();
}

bool PluginFactoryRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return factories_.count(id) != 0;
}

} // namespace prism
