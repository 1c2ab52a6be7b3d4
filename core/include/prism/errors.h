#pragma once

#include <stdexcept>
#include <string>

namespace prism {

// Malformed manifest, lock file, constraint or chain entry.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// An intercepted operation lacked a matching grant or hit a jail rule.
class AuthorizationDenied : public std::runtime_error {
public:
    AuthorizationDenied(const std::string& plugin, const std::string& event, const std::string& msg)
        : std::runtime_error(msg), plugin_(plugin), event_(event) {}

    const std::string& plugin() const { return plugin_; }
    const std::string& event() const { return event_; }

private:
    std::string plugin_;
    std::string event_;
};

// Absent lock file, manifest or entry point.
class MissingArtifact : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Missing or version-mismatched dependency.
class UnmetDependency : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DependencyCycleError : public std::runtime_error {
public:
    explicit DependencyCycleError(const std::string& cycle)
        : std::runtime_error("circular dependency detected: " + cycle), cycle_(cycle) {}

    const std::string& cycle() const { return cycle_; }

private:
    std::string cycle_;
};

} // namespace prism
