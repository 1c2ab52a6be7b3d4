#pragma once

#include <fstream>
#include <initializer_list>
#include <mutex>
#include <string>
#include <utility>

namespace prism {

// Append-only JSONL audit trail with a SHA256 hash chain.
// Each line: canonical {chain_hash, chain_prev, event, payload, seq, ts};
// chain_hash = SHA256(chain_prev || canonical record without chain fields).
// Reopening an existing file continues the chain from its last line.
class JsonlAuditLog {
public:
    explicit JsonlAuditLog(const std::string& path);

    // payload_json must be a JSON value; invalid JSON is stored as a string.
    void event(const std::string& name, const std::string& payload_json);

    const std::string& path() const { return path_; }
    bool ok() const { return static_cast<bool>(out_); }

private:
    std::string path_;
    std::ofstream out_;
    std::string chain_prev_;
    long long seq_{0};
    std::mutex mu_;
};

// Compact JSON object from flat string pairs, e.g. {{"plugin","x"},{"reason","y"}}.
std::string audit_payload(std::initializer_list<std::pair<const char*, std::string>> fields);

} // namespace prism
