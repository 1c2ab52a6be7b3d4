#include "prism/version.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <utility>

namespace prism {

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

static std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
static bool is_sep(char c) { return c == '.' || c == '-' || c == '_'; }

// Reads a run of digits at s[*i]. Fails on an empty run or more than 9 digits.
static bool read_num(const std::string& s, size_t* i, int* out) {
    size_t j = *i;
    while (j < s.size() && is_digit(s[j])) j++;
    if (j == *i || j - *i > 9) return false;
    *out = std::stoi(s.substr(*i, j - *i));
    *i = j;
    return true;
}

// Optional separator, then one of the words, then an optional number (default 0).
// Leaves *i untouched and returns -1 when no word matches.
static int read_tag(const std::string& s, size_t* i, const std::vector<std::pair<std::string, int>>& words,
                    int* num, bool* bad) {
    size_t p = *i;
    if (p < s.size() && is_sep(s[p])) p++;
    for (const auto& w : words) {
        if (s.compare(p, w.first.size(), w.first) != 0) continue;
        p += w.first.size();
        *num = 0;
        if (p + 1 < s.size() && is_sep(s[p]) && is_digit(s[p + 1])) p++;
        if (p < s.size() && is_digit(s[p]) && !read_num(s, &p, num)) {
            *bad = true;
            return -1;
        }
        *i = p;
        return w.second;
    }
    return -1;
}

std::optional<Version> Version::parse(const std::string& input) {
    std::string s = lower(trim(input));
    if (!s.empty() && s[0] == 'v') s.erase(0, 1);
    if (s.empty()) return std::nullopt;

    Version v;
    v.text = trim(input);
    size_t i = 0;

    size_t bang = s.find('!');
    if (bang != std::string::npos) {
        if (!read_num(s, &i, &v.epoch) || i != bang) return std::nullopt;
        i = bang + 1;
    }

    for (;;) {
        int part = 0;
        if (!read_num(s, &i, &part)) return std::nullopt;
        v.release.push_back(part);
        if (i + 1 < s.size() && s[i] == '.' && is_digit(s[i + 1])) {
            i++;
            continue;
        }
        break;
    }

    static const std::vector<std::pair<std::string, int>> kPre = {
        {"alpha", 0}, {"beta", 1}, {"preview", 2}, {"pre", 2}, {"rc", 2}, {"a", 0}, {"b", 1}, {"c", 2},
    };
    static const std::vector<std::pair<std::string, int>> kPost = {{"post", 0}, {"rev", 0}, {"r", 0}};
    static const std::vector<std::pair<std::string, int>> kDev = {{"dev", 0}};

    bool bad = false;
    int num = 0;
    int kind = read_tag(s, &i, kPre, &num, &bad);
    if (bad) return std::nullopt;
    if (kind >= 0) {
        v.pre_kind = kind;
        v.pre_num = num;
    }

    // 1.0-1 is an implicit post-release
    if (i + 1 < s.size() && s[i] == '-' && is_digit(s[i + 1])) {
        i++;
        if (!read_num(s, &i, &v.post)) return std::nullopt;
    } else if (read_tag(s, &i, kPost, &num, &bad) >= 0) {
        v.post = num;
    }
    if (bad) return std::nullopt;

    if (read_tag(s, &i, kDev, &num, &bad) >= 0) v.dev = num;
    if (bad) return std::nullopt;

    if (i < s.size() && s[i] == '+') {
        i++;
        std::string seg;
        for (; i <= s.size(); i++) {
            if (i == s.size() || is_sep(s[i])) {
                if (seg.empty()) return std::nullopt;
                v.local.push_back(seg);
                seg.clear();
                continue;
            }
            if (!std::isalnum(static_cast<unsigned char>(s[i]))) return std::nullopt;
            seg += s[i];
        }
    }
    if (i < s.size()) return std::nullopt;
    return v;
}

Version Version::public_version() const {
    Version p = *this;
    p.local.clear();
    return p;
}

Version Version::base_version() const {
    Version b;
    b.epoch = epoch;
    b.release = release;
    return b;
}

static bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), is_digit);
}

// Numeric local segments sort above alphanumeric ones and compare by value.
static int compare_local_segment(const std::string& a, const std::string& b) {
    const bool na = all_digits(a), nb = all_digits(b);
    if (na != nb) return na ? 1 : -1;
    if (!na) return a.compare(b) < 0 ? -1 : (a == b ? 0 : 1);
    std::string x = a.substr(std::min(a.find_first_not_of('0'), a.size()));
    std::string y = b.substr(std::min(b.find_first_not_of('0'), b.size()));
    if (x.size() != y.size()) return x.size() < y.size() ? -1 : 1;
    return x.compare(y) < 0 ? -1 : (x == y ? 0 : 1);
}

// Sort key for the pre-release slot. A bare dev release sorts before any
// pre-release of the same version, a final release after all of them.
static std::pair<int, int> pre_key(const Version& v) {
    if (v.pre_kind < 0 && v.post < 0 && v.dev >= 0) return {-1, 0};
    if (v.pre_kind < 0) return {3, 0};
    return {v.pre_kind, v.pre_num};
}

int Version::compare(const Version& o) const {
    if (epoch != o.epoch) return epoch < o.epoch ? -1 : 1;
    const size_t n = std::max(release.size(), o.release.size());
    for (size_t i = 0; i < n; i++) {
        int a = i < release.size() ? release[i] : 0;
        int b = i < o.release.size() ? o.release[i] : 0;
        if (a != b) return a < b ? -1 : 1;
    }
    auto pa = pre_key(*this), pb = pre_key(o);
    if (pa != pb) return pa < pb ? -1 : 1;
    if (post != o.post) return post < o.post ? -1 : 1;
    int da = dev < 0 ? INT_MAX : dev;
    int db = o.dev < 0 ? INT_MAX : o.dev;
    if (da != db) return da < db ? -1 : 1;
    for (size_t i = 0; i < local.size() && i < o.local.size(); i++) {
        int c = compare_local_segment(local[i], o.local[i]);
        if (c != 0) return c;
    }
    if (local.size() != o.local.size()) return local.size() < o.local.size() ? -1 : 1;
    return 0;
}

// Epoch and padded release prefix match; pre/post/dev/local of v are ignored.
static bool release_prefix_matches(const Version& prefix, const Version& v) {
    if (prefix.epoch != v.epoch) return false;
    for (size_t i = 0; i < prefix.release.size(); i++) {
        int have = i < v.release.size() ? v.release[i] : 0;
        if (have != prefix.release[i]) return false;
    }
    return true;
}

std::optional<VersionConstraint> VersionConstraint::parse(const std::string& spec) {
    static const char* kOps[] = {"===", "~=", "==", "!=", "<=", ">=", "<", ">"};

    VersionConstraint vc;
    vc.text_ = trim(spec);
    if (vc.text_.empty()) return std::nullopt;

    size_t i = 0;
    while (i <= vc.text_.size()) {
        size_t j = vc.text_.find(',', i);
        if (j == std::string::npos) j = vc.text_.size();
        std::string item = trim(vc.text_.substr(i, j - i));
        i = j + 1;

        Clause c;
        for (const char* op : kOps) {
            const std::string o = op;
            if (item.compare(0, o.size(), o) == 0) {
                c.op = o;
                break;
            }
        }
        if (c.op.empty()) return std::nullopt;
        c.raw = trim(item.substr(c.op.size()));
        if (c.raw.empty()) return std::nullopt;

        if (c.op == "===") {
            if (c.raw.find_first_of(" \t") != std::string::npos) return std::nullopt;
            auto v = Version::parse(c.raw);
            if (v && v->is_prerelease()) vc.prereleases_ = true;
            vc.clauses_.push_back(std::move(c));
            continue;
        }

        std::string rhs = c.raw;
        if (rhs.size() > 2 && rhs.compare(rhs.size() - 2, 2, ".*") == 0) {
            if (c.op != "==" && c.op != "!=") return std::nullopt;
            c.wildcard = true;
            rhs.resize(rhs.size() - 2);
        }
        auto v = Version::parse(rhs);
        if (!v) return std::nullopt;
        // A wildcard names epoch and release only
        if (c.wildcard && (v->pre_kind >= 0 || v->post >= 0 || v->dev >= 0 || v->has_local())) return std::nullopt;
        // Local labels are only meaningful for exact matches
        if (v->has_local() && c.op != "==" && c.op != "!=") return std::nullopt;
        if (c.op == "~=" && v->release.size() < 2) return std::nullopt;
        if (v->is_prerelease() && (c.op == "==" || c.op == ">=" || c.op == "<=" || c.op == "~=")) {
            vc.prereleases_ = true;
        }
        c.version = *v;
        vc.clauses_.push_back(std::move(c));
    }
    return vc;
}

bool VersionConstraint::clause_holds(const Clause& c, const Version& v) {
    if (c.op == "===") return lower(v.text) == lower(c.raw);

    if (c.wildcard) {
        bool prefix_eq = release_prefix_matches(c.version, v);
        return c.op == "==" ? prefix_eq : !prefix_eq;
    }

    if (c.op == "==" || c.op == "!=") {
        // Without a local label in the clause, the candidate's label is ignored
        const Version cand = c.version.has_local() ? v : v.public_version();
        bool eq = cand.compare(c.version) == 0;
        return c.op == "==" ? eq : !eq;
    }

    const Version pub = v.public_version();
    const int cmp = pub.compare(c.version);
    if (c.op == "<=") return cmp <= 0;
    if (c.op == ">=") return cmp >= 0;
    if (c.op == "<") {
        if (cmp >= 0) return false;
        // <2.0 does not admit 2.0rc1 unless the clause itself is a pre-release
        if (!c.version.is_prerelease() && v.is_prerelease() &&
            v.base_version().compare(c.version.base_version()) == 0) {
            return false;
        }
        return true;
    }
    if (c.op == ">") {
        if (v.compare(c.version) <= 0) return false;
        const bool same_base = v.base_version().compare(c.version.base_version()) == 0;
        // >1.0 does not admit 1.0.post1 or 1.0+local
        if (!c.version.is_postrelease() && v.is_postrelease() && same_base) return false;
        if (v.has_local() && same_base) return false;
        return true;
    }
    if (c.op == "~=") {
        // ~=X.Y.Z means >=X.Y.Z together with ==X.Y.*
        if (cmp < 0) return false;
        Version prefix = c.version.base_version();
        prefix.release.pop_back();
        return release_prefix_matches(prefix, v);
    }
    return false;
}

bool VersionConstraint::satisfied_by(const Version& v) const {
    if (v.is_prerelease() && !prereleases_) return false;
    for (const auto& c : clauses_) {
        if (!clause_holds(c, v)) return false;
    }
    return true;
}

ConstraintCheck check_version_constraint(const std::string& version, const std::string& constraint) {
    if (trim(constraint).empty()) return ConstraintCheck::Satisfied;
    auto vc = VersionConstraint::parse(constraint);
    auto v = Version::parse(version);
    if (!vc || !v) return ConstraintCheck::Unparseable;
    return vc->satisfied_by(*v) ? ConstraintCheck::Satisfied : ConstraintCheck::Unsatisfied;
}

} // namespace prism
