/**
 * @file http_url.h
 * @brief Parsed absolute URL used by requests and URL builders
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_STORAGE_HTTP_HTTP_URL_H
#define KCENON_BLOB_STORAGE_HTTP_HTTP_URL_H

#include "kcenon/blob_storage/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kcenon::blob_storage {

/**
 * @brief Absolute URL split into its components
 *
 * The path is kept exactly as supplied (percent-encoded). Query parameters
 * are stored decoded, in their original order, and re-encoded by
 * to_string().
 */
struct http_url {
    using query_parameter = std::pair<std::string, std::string>;

    std::string scheme;
    std::string host;
    std::optional<uint16_t> port;
    std::string path;
    std::vector<query_parameter> query;

    /**
     * @brief Parse an absolute URL ("scheme://host[:port][/path][?query]")
     * @return Parsed URL or error_code::invalid_url
     */
    [[nodiscard]] static auto parse(std::string_view url) -> result<http_url>;

    /**
     * @brief Serialize back to an absolute URL
     */
    [[nodiscard]] auto to_string() const -> std::string;

    /**
     * @brief Host with ":port" appended when a port is set
     */
    [[nodiscard]] auto authority() const -> std::string;

    /**
     * @brief Percent-decoded path
     */
    [[nodiscard]] auto decoded_path() const -> std::string;

    /**
     * @brief Encoded query string without the leading '?'
     */
    [[nodiscard]] auto encoded_query() const -> std::string;

    /**
     * @brief All values of a query parameter, in order
     */
    [[nodiscard]] auto query_values(std::string_view key) const -> std::vector<std::string>;

    /**
     * @brief Replace every value of a query parameter
     */
    void set_query(std::string_view key, std::string value);

    /**
     * @brief Append a query parameter
     */
    void add_query(std::string key, std::string value);

    /**
     * @brief Copy with a different host (port and path kept)
     */
    [[nodiscard]] auto with_host(std::string new_host) const -> http_url;

    [[nodiscard]] auto is_https() const -> bool { return scheme == "https"; }
};

/**
 * @brief Parse a raw query string ("a=1&b=2") into decoded pairs
 */
[[nodiscard]] auto parse_query_string(std::string_view query)
    -> std::vector<http_url::query_parameter>;

}  // namespace kcenon::blob_storage

#endif  // KCENON_BLOB_STORAGE_HTTP_HTTP_URL_H
