#pragma once

#include <filesystem>
#include <string>

namespace prism {

// Verifies plugin.sig against plugin.manifest and the files it lists.
// The listing must include the plugin manifest (plugin.yml, or group.yml for
// a bare group) and the entry library (manifest "entry", else plugin.so).
//
//   plugin.sig      {"signer_id", "signature" (base64), "algorithm": "RSA-PSS-SHA256"}
//   plugin.manifest {"metadata": {...}, "files": {"rel/path": "<sha256 hex>"}}
//
// digest = SHA256(canonical(metadata) + concat("path:hash") over sorted files);
// the signature is RSA-PSS/SHA-256 over the digest bytes, verified with
// <trusted_keys_dir>/<signer_id>.pem.
class PluginSignatureVerifier {
public:
    explicit PluginSignatureVerifier(std::filesystem::path trusted_keys_dir);

    // false (with err) on any missing file, hash mismatch or bad signature.
    bool verify_plugin(const std::filesystem::path& plugin_dir, std::string* err) const;

    // Digest over a parsed plugin.manifest; empty on malformed input.
    static std::string manifest_digest_hex(const std::string& manifest_json, std::string* err);

private:
    std::filesystem::path keys_dir_;
};

} // namespace prism
