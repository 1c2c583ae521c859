/**
 * @file http_headers.cpp
 * @brief Case-insensitive, insertion-ordered HTTP header multimap
 * @version 0.1.0
 */

#include "kcenon/blob_storage/http/http_headers.h"
#include "kcenon/blob_storage/core/storage_utils.h"

#include <algorithm>

namespace kcenon::blob_storage {

http_headers::http_headers(std::initializer_list<entry> entries) {
    for (const auto& [name, value] : entries) {
        add(name, value);
    }
}

void http_headers::set(std::string_view name, std::string value) {
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const entry& e) {
        return storage_utils::iequals(e.first, name);
    });

    if (it == entries_.end()) {
        entries_.emplace_back(std::string(name), std::move(value));
        return;
    }

    it->second = std::move(value);
    auto first = std::next(it);
    entries_.erase(std::remove_if(first, entries_.end(), [&](const entry& e) {
                       return storage_utils::iequals(e.first, name);
                   }),
                   entries_.end());
}

void http_headers::add(std::string_view name, std::string value) {
    entries_.emplace_back(std::string(name), std::move(value));
}

auto http_headers::remove(std::string_view name) -> std::size_t {
    auto before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(), [&](const entry& e) {
                       return storage_utils::iequals(e.first, name);
                   }),
                   entries_.end());
    return before - entries_.size();
}

auto http_headers::get(std::string_view name) const -> std::optional<std::string> {
    std::optional<std::string> joined;
    for (const auto& [key, value] : entries_) {
        if (!storage_utils::iequals(key, name)) {
            continue;
        }
        if (joined) {
            *joined += ',';
            *joined += value;
        } else {
            joined = value;
        }
    }
    return joined;
}

auto http_headers::get_or_empty(std::string_view name) const -> std::string {
    return get(name).value_or(std::string{});
}

auto http_headers::contains(std::string_view name) const -> bool {
    return std::any_of(entries_.begin(), entries_.end(), [&](const entry& e) {
        return storage_utils::iequals(e.first, name);
    });
}

auto http_headers::to_map() const -> std::map<std::string, std::string> {
    std::map<std::string, std::string> flattened;
    for (const auto& [key, value] : entries_) {
        auto it = std::find_if(flattened.begin(), flattened.end(), [&](const auto& kv) {
            return storage_utils::iequals(kv.first, key);
        });
        if (it == flattened.end()) {
            flattened.emplace(key, value);
        } else {
            it->second += ',';
            it->second += value;
        }
    }
    return flattened;
}

auto http_headers::from_map(const std::map<std::string, std::string>& map) -> http_headers {
    http_headers headers;
    for (const auto& [key, value] : map) {
        headers.add(key, value);
    }
    return headers;
}

}  // namespace kcenon::blob_storage
