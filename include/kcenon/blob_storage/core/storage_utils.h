/**
 * @file storage_utils.h
 * @brief Encoding, crypto and time helpers shared by the pipeline and signers
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_STORAGE_CORE_STORAGE_UTILS_H
#define KCENON_BLOB_STORAGE_CORE_STORAGE_UTILS_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::blob_storage::storage_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

/**
 * @brief Base64 encode bytes
 * @param data Vector of bytes to encode
 * @return Base64 encoded string (standard alphabet, padded)
 */
auto base64_encode(const std::vector<uint8_t>& data) -> std::string;

/**
 * @brief Base64 encode string
 */
auto base64_encode(const std::string& data) -> std::string;

/**
 * @brief Strict base64 decode
 *
 * Rejects characters outside the standard alphabet, lengths that are not a
 * multiple of four, and padding anywhere but the end.
 *
 * @param encoded Base64 encoded string
 * @return Decoded bytes, or std::nullopt when the input is malformed
 */
auto try_base64_decode(std::string_view encoded) -> std::optional<std::vector<uint8_t>>;

/**
 * @brief URL encode a string (RFC 3986)
 * @param value String to encode
 * @param encode_slash Whether to encode forward slashes (default: true)
 * @return URL encoded string with uppercase hex digits
 */
auto url_encode(std::string_view value, bool encode_slash = true) -> std::string;

/**
 * @brief Percent-decode a string
 *
 * Malformed escape sequences are kept verbatim.
 *
 * @param value Encoded string
 * @param plus_as_space Decode '+' as a space (form/query semantics)
 */
auto url_decode(std::string_view value, bool plus_as_space = false) -> std::string;

// ============================================================================
// String Utilities
// ============================================================================

/**
 * @brief ASCII lower-case copy
 */
auto to_lower(std::string_view value) -> std::string;

/**
 * @brief ASCII case-insensitive equality
 */
auto iequals(std::string_view lhs, std::string_view rhs) -> bool;

// ============================================================================
// Cryptographic Utilities
// ============================================================================

/**
 * @brief Calculate HMAC-SHA256
 * @param key HMAC key bytes
 * @param data Data to authenticate
 * @return 32-byte MAC
 */
auto hmac_sha256(const std::vector<uint8_t>& key,
                 std::string_view data) -> std::vector<uint8_t>;

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Format a time point as RFC 1123 (e.g. "Sun, 06 Nov 1994 08:49:37 GMT")
 */
auto format_rfc1123(std::chrono::system_clock::time_point tp) -> std::string;

/**
 * @brief Get current time in RFC 1123 format
 */
auto get_rfc1123_time() -> std::string;

/**
 * @brief Format a time point as ISO 8601 UTC with second precision
 *        (e.g. "2017-04-17T08:00:00Z")
 */
auto format_iso8601(std::chrono::system_clock::time_point tp) -> std::string;

// ============================================================================
// Random Utilities
// ============================================================================

/**
 * @brief Generate random bytes
 * @param count Number of bytes to generate
 */
auto generate_random_bytes(std::size_t count) -> std::vector<uint8_t>;

/**
 * @brief Generate a random RFC 4122 version 4 UUID string
 */
auto generate_uuid() -> std::string;

// ============================================================================
// XML Utilities
// ============================================================================

/**
 * @brief Extract the text of the first occurrence of an XML element
 * @param xml XML string
 * @param tag Element name
 * @return Element content, or std::nullopt when absent
 */
auto extract_xml_element(const std::string& xml,
                         const std::string& tag) -> std::optional<std::string>;

}  // namespace kcenon::blob_storage::storage_utils

#endif  // KCENON_BLOB_STORAGE_CORE_STORAGE_UTILS_H
