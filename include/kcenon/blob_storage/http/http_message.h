/**
 * @file http_message.h
 * @brief Request and response types carried through the pipeline
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_STORAGE_HTTP_HTTP_MESSAGE_H
#define KCENON_BLOB_STORAGE_HTTP_HTTP_MESSAGE_H

#include "http_headers.h"
#include "http_url.h"
#include "kcenon/blob_storage/core/types.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::blob_storage {

/**
 * @brief Well-known HTTP methods
 */
struct http_method {
    static constexpr const char* get = "GET";
    static constexpr const char* head = "HEAD";
    static constexpr const char* put = "PUT";
    static constexpr const char* post = "POST";
    static constexpr const char* del = "DELETE";
};

/**
 * @brief Outgoing HTTP request
 *
 * The body is an immutable shared buffer: copying a request is cheap and
 * every copy (one per retry) sends identical bytes.
 */
struct http_request {
    std::string method = http_method::get;
    http_url url;
    http_headers headers;
    std::shared_ptr<const std::vector<uint8_t>> body;

    http_request() = default;
    http_request(std::string m, http_url u)
        : method(std::move(m)), url(std::move(u)) {}

    void set_body(std::vector<uint8_t> data) {
        body = std::make_shared<const std::vector<uint8_t>>(std::move(data));
    }

    void set_body(const std::string& data) {
        set_body(std::vector<uint8_t>(data.begin(), data.end()));
    }

    [[nodiscard]] auto body_size() const -> std::size_t {
        return body ? body->size() : 0;
    }
};

/**
 * @brief HTTP response returned by the transport
 */
struct http_response {
    int status_code = 0;
    http_headers headers;
    std::vector<uint8_t> body;

    /// Service error code (x-ms-error-code or <Code>), set by response decoding
    std::optional<std::string> service_error_code;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    [[nodiscard]] auto is_success() const -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief Convert a non-success response into a terminal HTTP error
 *
 * The error keeps the original status so callers can branch on it
 * (e.g. 409 for "already exists").
 */
[[nodiscard]] inline auto to_error(const http_response& response) -> error {
    std::string message = "HTTP " + std::to_string(response.status_code);
    if (response.service_error_code) {
        message += " (" + *response.service_error_code + ")";
    }
    return error{error_code::terminal_http_error, std::move(message), response.status_code};
}

}  // namespace kcenon::blob_storage

#endif  // KCENON_BLOB_STORAGE_HTTP_HTTP_MESSAGE_H
