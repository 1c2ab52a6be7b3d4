#include "prism/capability_ledger.h"
#include "prism/log.h"

#include <iostream>

namespace prism {

static bool has_glob_chars(const std::string& s) {
    return s.find_first_of("*?[") != std::string::npos;
}

CapabilityLedger::CapabilityLedger(const PermissionEngine& engine) : engine_(engine) {}

std::vector<PermissionDeclaration> CapabilityLedger::grant_from_lock(
        const std::string& plugin, const std::vector<PermissionDeclaration>& entries) {
    std::set<std::string> names;
    std::vector<PermissionDeclaration> dropped;

    for (const auto& e : entries) {
        if (!e.name.empty()) {
            bool known = engine_.definition(e.name) != nullptr;
            if (!known && has_glob_chars(e.name)) {
                for (const auto& n : engine_.names()) {
                    if (glob_match(e.name, n)) { known = true; break; }
                }
            }
            if (known) {
                names.insert(e.name);
                continue;
            }
        } else if (const auto* def = engine_.find_definition_for_declaration(e.type, e.resource)) {
            names.insert(def->name);
            continue;
        }
        std::cerr << "[warn] ledger: dropping unmappable permission for " << plugin
                  << ": type=" << e.type << " resource=" << e.resource
                  << (e.name.empty() ? "" : " name=" + e.name) << "\n";
        dropped.push_back(e);
    }

    auto set = std::make_shared<const std::set<std::string>>(std::move(names));
    {
        std::lock_guard<std::mutex> lk(mu_);
        grants_[plugin] = set;
    }
    if (audit_) {
        std::string joined;
        for (const auto& n : *set) joined += (joined.empty() ? "" : ",") + n;
        audit_->event("grant", audit_payload({{"plugin", plugin}, {"capabilities", joined}}));
    }
    return dropped;
}

void CapabilityLedger::inherit(const std::string& plugin, const std::string& from) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = grants_.find(from);
    if (it == grants_.end()) {
        grants_[plugin] = std::make_shared<const std::set<std::string>>();
    } else {
        grants_[plugin] = it->second;
    }
}

void CapabilityLedger::revoke(const std::string& plugin) {
    std::lock_guard<std::mutex> lk(mu_);
    grants_.erase(plugin);
}

std::set<std::string> CapabilityLedger::granted(const std::string& plugin) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = grants_.find(plugin);
    if (it == grants_.end()) return {};
    return *it->second;
}

bool CapabilityLedger::has_grants(const std::string& plugin) const {
    std::lock_guard<std::mutex> lk(mu_);
    return grants_.count(plugin) != 0;
}

bool CapabilityLedger::check_locked(const std::set<std::string>& grants, const std::string& capability,
                                    const std::string& event, const OperationArgs& args) const {
    if (grants.count(capability)) return true;
    for (const auto& g : grants) {
        if (!has_glob_chars(g) || !glob_match(g, capability)) continue;
        if (event.empty() || engine_.resource_matches(capability, event, args)) return true;
    }
    return false;
}

bool CapabilityLedger::check_permission(const std::string& plugin, const std::string& capability,
                                        const std::string& event, const OperationArgs& args) const {
    std::shared_ptr<const std::set<std::string>> set;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = grants_.find(plugin);
        if (it == grants_.end()) return false;
        set = it->second;
    }
    return check_locked(*set, capability, event, args);
}

bool CapabilityLedger::holds_any(const std::string& plugin, const std::vector<std::string>& capabilities,
                                 const std::string& event, const OperationArgs& args) const {
    std::shared_ptr<const std::set<std::string>> set;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = grants_.find(plugin);
        if (it == grants_.end()) return false;
        set = it->second;
    }
    for (const auto& c : capabilities) {
        if (check_locked(*set, c, event, args)) return true;
    }
    return false;
}

bool CapabilityLedger::has_prefix(const std::string& plugin, const std::string& prefix) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = grants_.find(plugin);
    if (it == grants_.end()) return false;
    for (const auto& g : *it->second) {
        if (g.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
}

void CapabilityLedger::log_violation(const std::string& plugin, const std::string& message) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        violations_[plugin].push_back(message);
    }
    std::cerr << "[warn] [security] " << message << "\n";
    if (audit_) audit_->event("violation", audit_payload({{"plugin", plugin}, {"message", message}}));
}

std::vector<std::string> CapabilityLedger::violations(const std::string& plugin) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = violations_.find(plugin);
    if (it == violations_.end()) return {};
    return it->second;
}

} // namespace prism
