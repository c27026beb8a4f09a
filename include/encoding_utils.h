// @filename include/encoding_utils.h
#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <zlib.h>
#include <openssl/evp.h>

namespace Kindred {

// --- Encoded key bytes ---
// Path elements are joined by PATH_SEPARATOR, kind and identifier by KIND_SEPARATOR.
// All marker bytes sort below printable text so parents sort before children.
// NUL is never emitted: encoded keys double as backend ids and anchored regex prefixes.
static constexpr char PATH_SEPARATOR = '\x01';
static constexpr char KIND_SEPARATOR = '\x02';
static constexpr char ID_MARKER = '\x03';
static constexpr char NAME_MARKER = '\x04';
static constexpr char ESCAPE_BYTE = '\x05';
static constexpr size_t ENCODED_ID_WIDTH = 20;

// Escapes the reserved bytes 0x00-0x05 as ESCAPE_BYTE + ('0' + byte).
inline std::string escapeKeyComponent(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc <= static_cast<unsigned char>(ESCAPE_BYTE)) {
            out.push_back(ESCAPE_BYTE);
            out.push_back(static_cast<char>('0' + uc));
        } else {
            out.push_back(c);
        }
    }
    return out;
}

// Inverse of escapeKeyComponent; nullopt on a dangling or unknown escape.
inline std::optional<std::string> unescapeKeyComponent(const std::string& escaped) {
    std::string out;
    out.reserve(escaped.size());
    for (size_t i = 0; i < escaped.size(); ++i) {
        char c = escaped[i];
        if (c == ESCAPE_BYTE) {
            if (i + 1 >= escaped.size()) return std::nullopt;
            char code = escaped[++i];
            if (code < '0' || code > '0' + ESCAPE_BYTE) return std::nullopt;
            out.push_back(static_cast<char>(code - '0'));
        } else {
            out.push_back(c);
        }
    }
    return out;
}

// --- Order-preserving numeric ids ---
// Ids are positive, so zero-padded decimal sorts numerically as text.
inline std::string encodeIdOrderPreserving(int64_t id) {
    std::string digits = std::to_string(id);
    if (digits.size() < ENCODED_ID_WIDTH) {
        digits.insert(0, ENCODED_ID_WIDTH - digits.size(), '0');
    }
    return digits;
}

inline std::optional<int64_t> decodeIdOrderPreserving(const std::string& encoded) {
    if (encoded.size() != ENCODED_ID_WIDTH) return std::nullopt;
    int64_t value = 0;
    for (char c : encoded) {
        if (c < '0' || c > '9') return std::nullopt;
        int digit = c - '0';
        if (value > (INT64_MAX - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

// --- Checksums ---
inline uint32_t calculate_payload_checksum(const uint8_t* data, size_t len) {
    uLong crc = crc32(0L, Z_NULL, 0);
    if (data == nullptr || len == 0) {
        return static_cast<uint32_t>(crc);
    }
    crc = crc32(crc, data, static_cast<uInt>(len));
    return static_cast<uint32_t>(crc);
}

inline uint32_t calculate_payload_checksum(const std::string& data) {
    return calculate_payload_checksum(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

// --- URL-safe base64 (no padding) for opaque tokens ---
inline std::string encodeBase64Url(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) return std::string();
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), bytes.data(),
                                  static_cast<int>(bytes.size()));
    out.resize(static_cast<size_t>(written));
    while (!out.empty() && out.back() == '=') out.pop_back();
    for (char& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

inline std::optional<std::vector<uint8_t>> decodeBase64Url(const std::string& token) {
    if (token.empty() || token.size() % 4 == 1) return std::nullopt;
    std::string standard = token;
    for (char& c : standard) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
        else if (c == '+' || c == '/' || c == '=') return std::nullopt;
    }
    size_t padding = (4 - standard.size() % 4) % 4;
    standard.append(padding, '=');

    std::vector<uint8_t> out(3 * (standard.size() / 4));
    int decoded = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(standard.data()),
                                  static_cast<int>(standard.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) return std::nullopt;
    // EVP_DecodeBlock counts padding bytes as zero output bytes.
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
}

} // namespace Kindred
