/**
 * @file http_url.cpp
 * @brief Parsed absolute URL used by requests and URL builders
 * @version 0.1.0
 */

#include "kcenon/blob_storage/http/http_url.h"
#include "kcenon/blob_storage/core/storage_utils.h"

#include <algorithm>
#include <charconv>

namespace kcenon::blob_storage {

auto parse_query_string(std::string_view query) -> std::vector<http_url::query_parameter> {
    std::vector<http_url::query_parameter> params;

    std::size_t pos = 0;
    while (pos <= query.size()) {
        auto amp = query.find('&', pos);
        if (amp == std::string_view::npos) {
            amp = query.size();
        }

        auto pair = query.substr(pos, amp - pos);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            if (eq == std::string_view::npos) {
                params.emplace_back(storage_utils::url_decode(pair, true), std::string{});
            } else {
                params.emplace_back(storage_utils::url_decode(pair.substr(0, eq), true),
                                    storage_utils::url_decode(pair.substr(eq + 1), true));
            }
        }

        pos = amp + 1;
    }

    return params;
}

auto http_url::parse(std::string_view url) -> result<http_url> {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return unexpected{error{error_code::invalid_url,
            "URL has no scheme: " + std::string(url)}};
    }

    http_url parsed;
    parsed.scheme = storage_utils::to_lower(url.substr(0, scheme_end));

    auto rest = url.substr(scheme_end + 3);

    auto fragment = rest.find('#');
    if (fragment != std::string_view::npos) {
        rest = rest.substr(0, fragment);
    }

    std::string_view query_part;
    auto question = rest.find('?');
    if (question != std::string_view::npos) {
        query_part = rest.substr(question + 1);
        rest = rest.substr(0, question);
    }

    auto slash = rest.find('/');
    auto authority = rest.substr(0, slash);
    if (slash != std::string_view::npos) {
        parsed.path = std::string(rest.substr(slash));
    }

    // IPv6 literals keep their brackets in the host
    std::size_t port_sep = std::string_view::npos;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return unexpected{error{error_code::invalid_url,
                "Unterminated IPv6 host: " + std::string(url)}};
        }
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            port_sep = close + 1;
        }
    } else {
        port_sep = authority.rfind(':');
    }

    if (port_sep != std::string_view::npos) {
        auto port_str = authority.substr(port_sep + 1);
        uint16_t port_value = 0;
        auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port_value);
        if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || port_str.empty()) {
            return unexpected{error{error_code::invalid_url,
                "Invalid port in URL: " + std::string(url)}};
        }
        parsed.port = port_value;
        authority = authority.substr(0, port_sep);
    }

    if (authority.empty()) {
        return unexpected{error{error_code::invalid_url,
            "URL has no host: " + std::string(url)}};
    }
    parsed.host = std::string(authority);
    parsed.query = parse_query_string(query_part);

    return parsed;
}

auto http_url::authority() const -> std::string {
    if (port) {
        return host + ":" + std::to_string(*port);
    }
    return host;
}

auto http_url::to_string() const -> std::string {
    std::string url = scheme + "://" + authority() + path;
    auto q = encoded_query();
    if (!q.empty()) {
        url += '?';
        url += q;
    }
    return url;
}

auto http_url::decoded_path() const -> std::string {
    return storage_utils::url_decode(path);
}

auto http_url::encoded_query() const -> std::string {
    std::string encoded;
    for (const auto& [key, value] : query) {
        if (!encoded.empty()) {
            encoded += '&';
        }
        encoded += storage_utils::url_encode(key);
        encoded += '=';
        encoded += storage_utils::url_encode(value);
    }
    return encoded;
}

auto http_url::query_values(std::string_view key) const -> std::vector<std::string> {
    std::vector<std::string> values;
    for (const auto& [k, v] : query) {
        if (k == key) {
            values.push_back(v);
        }
    }
    return values;
}

void http_url::set_query(std::string_view key, std::string value) {
    query.erase(std::remove_if(query.begin(), query.end(),
                               [&](const query_parameter& p) { return p.first == key; }),
                query.end());
    query.emplace_back(std::string(key), std::move(value));
}

void http_url::add_query(std::string key, std::string value) {
    query.emplace_back(std::move(key), std::move(value));
}

auto http_url::with_host(std::string new_host) const -> http_url {
    http_url copy = *this;
    copy.host = std::move(new_host);
    return copy;
}

}  // namespace kcenon::blob_storage
