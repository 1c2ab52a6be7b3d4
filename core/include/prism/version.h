#pragma once

#include <optional>
#include <string>
#include <vector>

namespace prism {

// PEP 440 version: [N!]N(.N)*[{a|b|rc}N][.postN][.devN][+local].
// Accepts the usual spellings (v1.2.3, 1.0.0-beta.2, 1.0-1, 1.0rev3) and
// orders them the way pip does. Missing release components compare as zero.
struct Version {
    int epoch{0};
    std::vector<int> release;
    int pre_kind{-1};   // -1 none, 0=a, 1=b, 2=rc
    int pre_num{0};
    int post{-1};       // -1 none
    int dev{-1};        // -1 none
    std::vector<std::string> local;
    std::string text;

    static std::optional<Version> parse(const std::string& s);
    int compare(const Version& other) const;

    bool is_prerelease() const { return pre_kind >= 0 || dev >= 0; }
    bool is_postrelease() const { return post >= 0; }
    bool has_local() const { return !local.empty(); }

    // Same version without the +local label.
    Version public_version() const;
    // Epoch and release only.
    Version base_version() const;

    bool operator<(const Version& o) const { return compare(o) < 0; }
    bool operator==(const Version& o) const { return compare(o) == 0; }
};

// Comma-joined comparator set: ">=1.0,<2.0", "~=1.4", "==1.*", "!=1.3.2".
// All clauses must hold. Pre-releases only match when some clause names one.
class VersionConstraint {
public:
    // nullopt if any clause is malformed.
    static std::optional<VersionConstraint> parse(const std::string& spec);

    bool satisfied_by(const Version& v) const;
    bool allows_prereleases() const { return prereleases_; }
    const std::string& text() const { return text_; }

private:
    struct Clause {
        std::string op;            // ==, !=, <=, >=, <, >, ~=, ===
        Version version;
        bool wildcard{false};      // ==X.Y.* / !=X.Y.*
        std::string raw;           // right-hand side, for ===
    };
    static bool clause_holds(const Clause& c, const Version& v);

    std::vector<Clause> clauses_;
    bool prereleases_{false};
    std::string text_;
};

enum class ConstraintCheck { Satisfied, Unsatisfied, Unparseable };

// Empty constraint is always satisfied. An unparseable version or constraint
// yields Unparseable; callers decide whether that is fatal.
ConstraintCheck check_version_constraint(const std::string& version, const std::string& constraint);

} // namespace prism
