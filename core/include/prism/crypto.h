#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace prism {

// SHA256 (OpenSSL EVP)
std::vector<uint8_t> sha256_bytes(const uint8_t* data, size_t n);
std::string sha256_hex(const uint8_t* data, size_t n);
inline std::string sha256_hex(const std::string& s) {
    return sha256_hex(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

// SHA256 of a file's contents (empty string on error)
std::string sha256_hex_file(const std::filesystem::path& path);

// Constant-time string equality (for comparing hex digests)
bool constant_time_eq(const std::string& a, const std::string& b);

std::string base64_encode(const std::vector<uint8_t>& data);
// nullopt on malformed input
std::optional<std::vector<uint8_t>> base64_decode(const std::string& text);

} // namespace prism
