#include "prism/crypto.h"

#include <openssl/evp.h>

#include <fstream>
#include <memory>

namespace prism {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* c) const { EVP_MD_CTX_free(c); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string to_hex(const uint8_t* d, size_t n) {
    static const char* k = "0123456789abcdef";
    std::string out;
    out.resize(n * 2);
    for (size_t i = 0; i < n; i++) {
        out[2 * i] = k[(d[i] >> 4) & 0xF];
        out[2 * i + 1] = k[d[i] & 0xF];
    }
    return out;
}

} // namespace

std::vector<uint8_t> sha256_bytes(const uint8_t* data, size_t n) {
    std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (EVP_Digest(data, n, out.data(), &len, EVP_sha256(), nullptr) != 1) return {};
    out.resize(len);
    return out;
}

std::string sha256_hex(const uint8_t* data, size_t n) {
    auto d = sha256_bytes(data, n);
    return to_hex(d.data(), d.size());
}

std::string sha256_hex_file(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return "";

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) return "";

    char buf[8192];
    while (f.read(buf, sizeof(buf)) || f.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buf, static_cast<size_t>(f.gcount())) != 1) return "";
    }
    if (f.bad()) return "";

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &len) != 1) return "";
    return to_hex(md, len);
}

bool constant_time_eq(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); i++) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return "";
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data.data(),
                                  static_cast<int>(data.size()));
    out.resize(n < 0 ? 0 : static_cast<size_t>(n));
    return out;
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string& text) {
    std::string s;
    s.reserve(text.size());
    for (char c : text) {
        if (c == '\n' || c == '\r' || c == ' ' || c == '\t') continue;
        s.push_back(c);
    }
    if (s.empty()) return std::vector<uint8_t>{};
    if (s.size() % 4 != 0) return std::nullopt;

    std::vector<uint8_t> out(3 * s.size() / 4);
    const int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(s.data()),
                                  static_cast<int>(s.size()));
    if (n < 0) return std::nullopt;

    // EVP_DecodeBlock does not strip the bytes produced by '=' padding.
    size_t pad = 0;
    if (s[s.size() - 1] == '=') pad++;
    if (s[s.size() - 2] == '=') pad++;
    out.resize(static_cast<size_t>(n) - pad);
    return out;
}

} // namespace prism
