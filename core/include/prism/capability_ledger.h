#pragma once

#include "prism/permission_engine.h"

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace prism {

class JsonlAuditLog;

// Per-plugin granted capability names plus the append-only violation log.
// Grants are replaced wholesale, so readers never observe a partial set.
class CapabilityLedger {
public:
    explicit CapabilityLedger(const PermissionEngine& engine);

    // Replaces the plugin's grants with the mappable declarations.
    // Returns the declarations that could not be mapped (dropped, fail-closed).
    std::vector<PermissionDeclaration> grant_from_lock(const std::string& plugin,
                                                       const std::vector<PermissionDeclaration>& entries);

    // Copies another plugin's grants (sub-plugins inherit their group's set).
    void inherit(const std::string& plugin, const std::string& from);
    void revoke(const std::string& plugin);

    std::set<std::string> granted(const std::string& plugin) const;
    bool has_grants(const std::string& plugin) const;

    // Exact name, or a granted glob pattern whose capability also accepts `args`.
    bool check_permission(const std::string& plugin, const std::string& capability,
                          const std::string& event = "", const OperationArgs& args = {}) const;

    // OR semantics: any one of `capabilities` suffices.
    bool holds_any(const std::string& plugin, const std::vector<std::string>& capabilities,
                   const std::string& event, const OperationArgs& args) const;

    bool has_prefix(const std::string& plugin, const std::string& prefix) const;

    void log_violation(const std::string& plugin, const std::string& message);
    std::vector<std::string> violations(const std::string& plugin) const;

    void set_audit_log(std::shared_ptr<JsonlAuditLog> log) { audit_ = std::move(log); }

private:
    bool check_locked(const std::set<std::string>& grants, const std::string& capability,
                      const std::string& event, const OperationArgs& args) const;

    const PermissionEngine& engine_;
    mutable std::mutex mu_;
    std::map<std::string, std::shared_ptr<const std::set<std::string>>> grants_;
    std::map<std::string, std::vector<std::string>> violations_;
    std::shared_ptr<JsonlAuditLog> audit_;
};

} // namespace prism
