/**
 * @file request_conditions.cpp
 * @brief Conditional-request headers, lease conditions and byte ranges
 * @version 0.1.0
 */

#include "kcenon/blob_storage/http/request_conditions.h"
#include "kcenon/blob_storage/core/storage_constants.h"
#include "kcenon/blob_storage/core/storage_utils.h"

#include <limits>

namespace kcenon::blob_storage {

void http_access_conditions::apply(http_headers& headers) const {
    if (if_modified_since) {
        headers.set(header_names::if_modified_since,
                    storage_utils::format_rfc1123(*if_modified_since));
    }
    if (if_unmodified_since) {
        headers.set(header_names::if_unmodified_since,
                    storage_utils::format_rfc1123(*if_unmodified_since));
    }
    if (!if_match.is_none()) {
        headers.set(header_names::if_match, if_match.value());
    }
    if (!if_none_match.is_none()) {
        headers.set(header_names::if_none_match, if_none_match.value());
    }
}

void lease_access_conditions::apply(http_headers& headers) const {
    if (!lease_id.empty()) {
        headers.set(header_names::lease_id, lease_id);
    }
}

auto blob_range::to_header() const -> result<std::string> {
    if (offset < 0) {
        return unexpected{error{error_code::invalid_argument,
            "Range offset must be non-negative"}};
    }
    if (count < 0) {
        return unexpected{error{error_code::invalid_argument,
            "Range count must be non-negative"}};
    }

    if (count == 0) {
        return "bytes=" + std::to_string(offset) + "-";
    }
    if (count - 1 > std::numeric_limits<int64_t>::max() - offset) {
        return unexpected{error{error_code::invalid_argument,
            "Range end exceeds the largest representable offset"}};
    }
    return "bytes=" + std::to_string(offset) + "-" + std::to_string(offset + count - 1);
}

auto blob_range::apply(http_headers& headers) const -> result<void> {
    auto header = to_header();
    if (!header) {
        return unexpected{header.error()};
    }
    if (offset != 0 || count != 0) {
        headers.set(header_names::range, header.value());
    }
    return {};
}

}  // namespace kcenon::blob_storage
