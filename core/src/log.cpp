#include "prism/log.h"
#include "prism/crypto.h"
#include "prism/json_mini.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace prism {

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

JsonlAuditLog::JsonlAuditLog(const std::string& path) : path_(path), chain_prev_(std::string(64, '0')) {
    {
        std::ifstream in(path);
        std::string line, last;
        while (std::getline(in, line)) {
            if (!line.empty()) last = line;
        }
        if (!last.empty()) {
            json_mini::Doc d = json_mini::parse(last);
            auto h = json_mini::string_at(d.root, "chain_hash");
            auto s = json_mini::int_at(d.root, "seq");
            if (h) chain_prev_ = *h;
            if (s) seq_ = *s;
        }
    }
    out_.open(path, std::ios::out | std::ios::app);
}

void JsonlAuditLog::event(const std::string& name, const std::string& payload_json) {
    std::lock_guard<std::mutex> lk(mu_);
    const std::string ts = iso_now();
    const long long seq = ++seq_;

    auto build = [&](json_object* rec) {
        json_mini::put_string(rec, "event", name);
        json_mini::Doc payload = json_mini::parse(payload_json);
        json_object_object_add(rec, "payload",
            payload ? payload.release() : json_object_new_string(payload_json.c_str()));
        json_object_object_add(rec, "seq", json_object_new_int64(seq));
        json_mini::put_string(rec, "ts", ts);
    };

    json_mini::Doc rec = json_mini::Doc::object();
    build(rec.root);
    const std::string record = json_mini::canonical_json(rec.root);
    const std::string chain_hash = sha256_hex(chain_prev_ + record);

    json_mini::Doc line = json_mini::Doc::object();
    build(line.root);
    json_mini::put_string(line.root, "chain_hash", chain_hash);
    json_mini::put_string(line.root, "chain_prev", chain_prev_);

    out_ << json_mini::canonical_json(line.root) << "\n";
    out_.flush();
    chain_prev_ = chain_hash;
}

std::string audit_payload(std::initializer_list<std::pair<const char*, std::string>> fields) {
    json_mini::Doc d = json_mini::Doc::object();
    for (const auto& f : fields) json_mini::put_string(d.root, f.first, f.second);
    return json_mini::canonical_json(d.root);
}

} // namespace prism
