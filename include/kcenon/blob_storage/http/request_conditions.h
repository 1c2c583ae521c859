/**
 * @file request_conditions.h
 * @brief Conditional-request headers, lease conditions and byte ranges
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_STORAGE_HTTP_REQUEST_CONDITIONS_H
#define KCENON_BLOB_STORAGE_HTTP_REQUEST_CONDITIONS_H

#include "http_headers.h"
#include "kcenon/blob_storage/core/types.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace kcenon::blob_storage {

/**
 * @brief ETag precondition with an explicit "no condition" state
 */
class etag_condition {
public:
    enum class kind { none, any, specific };

    /// No precondition (header omitted)
    [[nodiscard]] static auto none() -> etag_condition { return etag_condition(kind::none, {}); }

    /// Matches any existing entity ("*")
    [[nodiscard]] static auto any() -> etag_condition { return etag_condition(kind::any, "*"); }

    /// Matches one entity tag
    [[nodiscard]] static auto specific(std::string etag) -> etag_condition {
        return etag_condition(kind::specific, std::move(etag));
    }

    etag_condition() : kind_(kind::none) {}

    [[nodiscard]] auto get_kind() const -> kind { return kind_; }
    [[nodiscard]] auto is_none() const -> bool { return kind_ == kind::none; }
    [[nodiscard]] auto value() const -> const std::string& { return value_; }

    [[nodiscard]] auto operator==(const etag_condition& other) const -> bool = default;

private:
    etag_condition(kind k, std::string v) : kind_(k), value_(std::move(v)) {}

    kind kind_;
    std::string value_;
};

/**
 * @brief Standard HTTP conditional headers
 */
struct http_access_conditions {
    std::optional<std::chrono::system_clock::time_point> if_modified_since;
    std::optional<std::chrono::system_clock::time_point> if_unmodified_since;
    etag_condition if_match;
    etag_condition if_none_match;

    /**
     * @brief Stamp every set condition onto @p headers
     */
    void apply(http_headers& headers) const;

    [[nodiscard]] auto empty() const -> bool {
        return !if_modified_since && !if_unmodified_since &&
               if_match.is_none() && if_none_match.is_none();
    }
};

/**
 * @brief Lease precondition (x-ms-lease-id)
 */
struct lease_access_conditions {
    std::string lease_id;

    void apply(http_headers& headers) const;
};

/**
 * @brief Byte range of a blob
 *
 * A count of zero means "to the end of the blob".
 */
struct blob_range {
    int64_t offset = 0;
    int64_t count = 0;

    /**
     * @brief Render as a Range header value
     * @return "bytes=offset-" or "bytes=offset-last", or invalid_argument
     */
    [[nodiscard]] auto to_header() const -> result<std::string>;

    /**
     * @brief Stamp the Range header, unless this is the whole blob
     */
    [[nodiscard]] auto apply(http_headers& headers) const -> result<void>;
};

}  // namespace kcenon::blob_storage

#endif  // KCENON_BLOB_STORAGE_HTTP_REQUEST_CONDITIONS_H
