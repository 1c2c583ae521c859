/**
 * @file storage_utils.cpp
 * @brief Encoding, crypto and time helpers shared by the pipeline and signers
 * @version 0.1.0
 */

#include "kcenon/blob_storage/core/storage_utils.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <random>
#include <sstream>

#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace kcenon::blob_storage::storage_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

namespace {
constexpr const char* BASE64_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr int BASE64_DECODE_TABLE[256] = {
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,62,-1,-1,-1,63,
    52,53,54,55,56,57,58,59,60,61,-1,-1,-1,-1,-1,-1,
    -1, 0, 1, 2, 3, 4, 5, 6, 7, 8, 9,10,11,12,13,14,
    15,16,17,18,19,20,21,22,23,24,25,-1,-1,-1,-1,-1,
    -1,26,27,28,29,30,31,32,33,34,35,36,37,38,39,40,
    41,42,43,44,45,46,47,48,49,50,51,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1
};

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
}  // namespace

auto base64_encode(const std::vector<uint8_t>& data) -> std::string {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < data.size()) n |= static_cast<uint32_t>(data[i + 2]);

        result += BASE64_CHARS[(n >> 18) & 0x3F];
        result += BASE64_CHARS[(n >> 12) & 0x3F];
        result += (i + 1 < data.size()) ? BASE64_CHARS[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < data.size()) ? BASE64_CHARS[n & 0x3F] : '=';
    }

    return result;
}

auto base64_encode(const std::string& data) -> std::string {
    std::vector<uint8_t> bytes(data.begin(), data.end());
    return base64_encode(bytes);
}

auto try_base64_decode(std::string_view encoded) -> std::optional<std::vector<uint8_t>> {
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }

    std::size_t padding = 0;
    if (!encoded.empty() && encoded.back() == '=') {
        padding = (encoded.size() >= 2 && encoded[encoded.size() - 2] == '=') ? 2 : 1;
    }

    std::vector<uint8_t> result;
    result.reserve((encoded.size() / 4) * 3);

    uint32_t bits = 0;
    int bit_count = 0;
    const std::size_t data_len = encoded.size() - padding;

    for (std::size_t i = 0; i < data_len; ++i) {
        int val = BASE64_DECODE_TABLE[static_cast<unsigned char>(encoded[i])];
        if (val < 0) {
            return std::nullopt;
        }

        bits = (bits << 6) | static_cast<uint32_t>(val);
        bit_count += 6;

        if (bit_count >= 8) {
            bit_count -= 8;
            result.push_back(static_cast<uint8_t>((bits >> bit_count) & 0xFF));
        }
    }

    return result;
}

auto url_encode(std::string_view value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::uppercase
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto url_decode(std::string_view value, bool plus_as_space) -> std::string {
    std::string decoded;
    decoded.reserve(value.size());

    for (std::size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '%' && i + 2 < value.size()) {
            int hi = hex_value(value[i + 1]);
            int lo = hex_value(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                decoded += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        if (c == '+' && plus_as_space) {
            decoded += ' ';
        } else {
            decoded += c;
        }
    }

    return decoded;
}

// ============================================================================
// String Utilities
// ============================================================================

auto to_lower(std::string_view value) -> std::string {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

auto iequals(std::string_view lhs, std::string_view rhs) -> bool {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(),
                      [](unsigned char a, unsigned char b) {
                          return std::tolower(a) == std::tolower(b);
                      });
}

// ============================================================================
// Cryptographic Utilities
// ============================================================================

auto hmac_sha256(const std::vector<uint8_t>& key,
                 std::string_view data) -> std::vector<uint8_t> {
    std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;

    HMAC(EVP_sha256(),
         key.data(),
         static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()),
         data.size(),
         result.data(),
         &len);

    result.resize(len);
    return result;
}

// ============================================================================
// Time Utilities
// ============================================================================

namespace {
auto to_utc_tm(std::chrono::system_clock::time_point tp) -> std::tm {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &time_t);
#else
    gmtime_r(&time_t, &tm);
#endif
    return tm;
}
}  // namespace

auto format_rfc1123(std::chrono::system_clock::time_point tp) -> std::string {
    auto tm = to_utc_tm(tp);
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    return oss.str();
}

auto get_rfc1123_time() -> std::string {
    return format_rfc1123(std::chrono::system_clock::now());
}

auto format_iso8601(std::chrono::system_clock::time_point tp) -> std::string {
    auto tm = to_utc_tm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// ============================================================================
// Random Utilities
// ============================================================================

auto generate_random_bytes(std::size_t count) -> std::vector<uint8_t> {
    std::vector<uint8_t> bytes(count);
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 255);

    for (std::size_t i = 0; i < count; ++i) {
        bytes[i] = static_cast<uint8_t>(dis(gen));
    }

    return bytes;
}

auto generate_uuid() -> std::string {
    auto bytes = generate_random_bytes(16);
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

// ============================================================================
// XML Utilities
// ============================================================================

auto extract_xml_element(const std::string& xml,
                         const std::string& tag) -> std::optional<std::string> {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    auto start_pos = xml.find(open_tag);
    if (start_pos == std::string::npos) {
        return std::nullopt;
    }
    start_pos += open_tag.length();

    auto end_pos = xml.find(close_tag, start_pos);
    if (end_pos == std::string::npos) {
        return std::nullopt;
    }

    return xml.substr(start_pos, end_pos - start_pos);
}

}  // namespace kcenon::blob_storage::storage_utils
