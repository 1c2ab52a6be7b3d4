#include "prism/signature.h"
#include "prism/crypto.h"
#include "prism/json_mini.h"
#include "prism/manifest.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <cctype>
#include <cstdio>
#include <fstream>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <vector>

namespace prism {

namespace fs = std::filesystem;

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* k) const { EVP_PKEY_free(k); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* c) const { EVP_MD_CTX_free(c); }
};
struct FileCloser {
    void operator()(FILE* f) const { if (f) std::fclose(f); }
};

std::string openssl_error() {
    unsigned long e = ERR_get_error();
    if (!e) return "unknown OpenSSL error";
    char buf[256];
    ERR_error_string_n(e, buf, sizeof(buf));
    return buf;
}

bool read_text(const fs::path& p, std::string* out) {
    std::ifstream in(p, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    *out = ss.str();
    return true;
}

// signer ids become file names; reject anything that could escape keys_dir.
bool safe_signer_id(const std::string& id) {
    if (id.empty() || id == "." || id == "..") return false;
    for (char c : id) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.')) return false;
    }
    return true;
}

// The manifest and the code the loader would execute. Builtin entries have no file.
bool required_signed_files(const fs::path& dir, std::vector<std::string>* out, std::string* err) {
    auto manifest_file = find_manifest_file(dir);
    std::error_code ec;
    if (manifest_file) {
        out->push_back(manifest_file->filename().string());
    } else if (fs::is_regular_file(dir / kGroupFileName, ec)) {
        out->push_back(kGroupFileName);
    }

    std::string entry;
    try {
        entry = read_plugin_manifest(dir).entry;
    } catch (const std::exception& e) {
        if (err) *err = std::string("cannot read plugin manifest: ") + e.what();
        return false;
    }
    if (entry.rfind("builtin:", 0) == 0) return true;
    if (!entry.empty()) {
        out->push_back(fs::path(entry).lexically_normal().generic_string());
    } else if (fs::is_regular_file(dir / "plugin.so", ec)) {
        out->push_back("plugin.so");
    }
    return true;
}

} // namespace

PluginSignatureVerifier::PluginSignatureVerifier(fs::path trusted_keys_dir)
    : keys_dir_(std::move(trusted_keys_dir)) {}

std::string PluginSignatureVerifier::manifest_digest_hex(const std::string& manifest_json, std::string* err) {
    json_mini::Doc d = json_mini::parse(manifest_json);
    json_object* metadata = json_mini::member(d.root, "metadata");
    json_object* files = json_mini::member(d.root, "files");
    if (!metadata || !files || !json_object_is_type(files, json_type_object)) {
        if (err) *err = "plugin.manifest needs 'metadata' and 'files'";
        return "";
    }
    std::map<std::string, std::string> sorted;
    json_object_object_foreach(files, k, v) {
        if (!v || !json_object_is_type(v, json_type_string)) {
            if (err) *err = std::string("non-string hash for ") + k;
            return "";
        }
        sorted[k] = json_object_get_string(v);
    }
    std::string buf = json_mini::canonical_json(metadata);
    for (const auto& kv : sorted) buf += kv.first + ":" + kv.second;
    return sha256_hex(buf);
}

bool PluginSignatureVerifier::verify_plugin(const fs::path& plugin_dir, std::string* err) const {
    std::string sig_text, manifest_text;
    if (!read_text(plugin_dir / "plugin.sig", &sig_text)) {
        if (err) *err = "missing plugin.sig";
        return false;
    }
    if (!read_text(plugin_dir / "plugin.manifest", &manifest_text)) {
        if (err) *err = "missing plugin.manifest";
        return false;
    }

    json_mini::Doc sig = json_mini::parse(sig_text);
    auto signer = json_mini::string_at(sig.root, "signer_id");
    auto sig_b64 = json_mini::string_at(sig.root, "signature");
    auto algorithm = json_mini::string_at(sig.root, "algorithm").value_or("RSA-PSS-SHA256");
    if (!signer || !sig_b64) {
        if (err) *err = "plugin.sig needs 'signer_id' and 'signature'";
        return false;
    }
    if (algorithm != "RSA-PSS-SHA256") {
        if (err) *err = "unsupported signature algorithm: " + algorithm;
        return false;
    }
    if (!safe_signer_id(*signer)) {
        if (err) *err = "invalid signer id: " + *signer;
        return false;
    }

    // Every listed file must match its recorded hash.
    json_mini::Doc manifest = json_mini::parse(manifest_text);
    json_object* files = json_mini::member(manifest.root, "files");
    std::set<std::string> listed;
    if (files && json_object_is_type(files, json_type_object)) {
        json_object_object_foreach(files, rel, expected) {
            listed.insert(fs::path(rel).lexically_normal().generic_string());
            const std::string rel_s = rel;
            if (fs::path(rel_s).is_absolute() || rel_s.find("..") != std::string::npos) {
                if (err) *err = "manifest path escapes plugin dir: " + rel_s;
                return false;
            }
            std::string actual = sha256_hex_file(plugin_dir / rel_s);
            if (actual.empty()) {
                if (err) *err = "listed file missing: " + rel_s;
                return false;
            }
            if (!expected || !constant_time_eq(actual, json_object_get_string(expected))) {
                if (err) *err = "hash mismatch for " + rel_s;
                return false;
            }
        }
    }

    // The manifest and entry library must be covered, not just whatever was listed.
    std::vector<std::string> required;
    if (!required_signed_files(plugin_dir, &required, err)) return false;
    for (const auto& rel : required) {
        if (!listed.count(rel)) {
            if (err) *err = "file not covered by plugin.manifest: " + rel;
            return false;
        }
    }

    std::string digest_hex = manifest_digest_hex(manifest_text, err);
    if (digest_hex.empty()) return false;
    std::vector<uint8_t> digest;
    for (size_t i = 0; i + 1 < digest_hex.size(); i += 2) {
        digest.push_back(static_cast<uint8_t>(std::stoi(digest_hex.substr(i, 2), nullptr, 16)));
    }

    auto signature = base64_decode(*sig_b64);
    if (!signature || signature->empty()) {
        if (err) *err = "signature is not valid base64";
        return false;
    }

    const fs::path key_path = keys_dir_ / (*signer + ".pem");
    std::unique_ptr<FILE, FileCloser> kf(std::fopen(key_path.c_str(), "r"));
    if (!kf) {
        if (err) *err = "untrusted signer: " + *signer;
        return false;
    }
    std::unique_ptr<EVP_PKEY, PkeyDeleter> key(PEM_read_PUBKEY(kf.get(), nullptr, nullptr, nullptr));
    if (!key) {
        if (err) *err = "cannot read public key " + key_path.string() + ": " + openssl_error();
        return false;
    }

    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    EVP_PKEY_CTX* pctx = nullptr;
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), &pctx, EVP_sha256(), nullptr, key.get()) != 1 ||
        EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) != 1 ||
        EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_AUTO) != 1 ||
        EVP_PKEY_CTX_set_rsa_mgf1_md(pctx, EVP_sha256()) != 1) {
        if (err) *err = "signature verifier setup failed: " + openssl_error();
        return false;
    }
    if (EVP_DigestVerifyUpdate(ctx.get(), digest.data(), digest.size()) != 1) {
        if (err) *err = "signature verification failed: " + openssl_error();
        return false;
    }
    if (EVP_DigestVerifyFinal(ctx.get(), signature->data(), signature->size()) != 1) {
        ERR_clear_error();
        if (err) *err = "signature does not match";
        return false;
    }
    return true;
}

} // namespace prism
