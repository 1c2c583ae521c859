/**
 * @file http_headers.h
 * @brief Case-insensitive, insertion-ordered HTTP header multimap
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_STORAGE_HTTP_HTTP_HEADERS_H
#define KCENON_BLOB_STORAGE_HTTP_HTTP_HEADERS_H

#include <cstddef>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kcenon::blob_storage {

/**
 * @brief HTTP header collection
 *
 * Names compare case-insensitively. Entries keep their insertion order and
 * the casing they were first written with. A name may appear more than once;
 * get() joins the values with ',' in insertion order.
 */
class http_headers {
public:
    using entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<entry>::const_iterator;

    http_headers() = default;
    http_headers(std::initializer_list<entry> entries);

    /**
     * @brief Replace every value of a header with a single value
     */
    void set(std::string_view name, std::string value);

    /**
     * @brief Append a value, keeping existing values of the same name
     */
    void add(std::string_view name, std::string value);

    /**
     * @brief Remove every value of a header
     * @return Number of entries removed
     */
    auto remove(std::string_view name) -> std::size_t;

    /**
     * @brief Get a header value; duplicates are comma-joined in order
     */
    [[nodiscard]] auto get(std::string_view name) const -> std::optional<std::string>;

    /**
     * @brief Get a header value or an empty string
     */
    [[nodiscard]] auto get_or_empty(std::string_view name) const -> std::string;

    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }

    [[nodiscard]] auto begin() const noexcept -> const_iterator { return entries_.begin(); }
    [[nodiscard]] auto end() const noexcept -> const_iterator { return entries_.end(); }

    /**
     * @brief Flatten into a name -> value map for transports that take one
     *
     * Duplicate names collapse into one comma-joined entry keyed by the
     * first-seen casing.
     */
    [[nodiscard]] auto to_map() const -> std::map<std::string, std::string>;

    /**
     * @brief Build from a transport's name -> value map
     */
    [[nodiscard]] static auto from_map(const std::map<std::string, std::string>& map)
        -> http_headers;

private:
    std::vector<entry> entries_;
};

}  // namespace kcenon::blob_storage

#endif  // KCENON_BLOB_STORAGE_HTTP_HTTP_HEADERS_H
