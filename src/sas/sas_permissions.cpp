/**
 * @file sas_permissions.cpp
 * @brief SAS permission set parsing and canonical rendering
 * @version 0.1.0
 */

#include "kcenon/blob_storage/sas/sas_permissions.h"

namespace kcenon::blob_storage {

namespace {

auto unknown_character(std::string_view kind, char c, std::string_view value) -> error {
    return error{error_code::invalid_argument,
        "Invalid " + std::string(kind) + " character '" + std::string(1, c) +
        "' in \"" + std::string(value) + "\""};
}

void append_if(std::string& out, bool set, char c) {
    if (set) {
        out += c;
    }
}

}  // namespace

// ============================================================================
// account_sas_permission
// ============================================================================

auto account_sas_permission::parse(std::string_view value) -> result<account_sas_permission> {
    account_sas_permission p;
    for (char c : value) {
        switch (c) {
            case 'r': p.read = true; break;
            case 'a': p.add = true; break;
            case 'c': p.create = true; break;
            case 'w': p.write = true; break;
            case 'd': p.del = true; break;
            case 'l': p.list = true; break;
            case 'u': p.update = true; break;
            case 'p': p.process = true; break;
            default:
                return unexpected{unknown_character("account permission", c, value)};
        }
    }
    return p;
}

auto account_sas_permission::to_string() const -> std::string {
    std::string out;
    append_if(out, read, 'r');
    append_if(out, add, 'a');
    append_if(out, create, 'c');
    append_if(out, write, 'w');
    append_if(out, del, 'd');
    append_if(out, list, 'l');
    append_if(out, update, 'u');
    append_if(out, process, 'p');
    return out;
}

// ============================================================================
// container_sas_permission
// ============================================================================

auto container_sas_permission::parse(std::string_view value) -> result<container_sas_permission> {
    container_sas_permission p;
    for (char c : value) {
        switch (c) {
            case 'r': p.read = true; break;
            case 'a': p.add = true; break;
            case 'c': p.create = true; break;
            case 'w': p.write = true; break;
            case 'd': p.del = true; break;
            case 'l': p.list = true; break;
            default:
                return unexpected{unknown_character("container permission", c, value)};
        }
    }
    return p;
}

auto container_sas_permission::to_string() const -> std::string {
    std::string out;
    append_if(out, read, 'r');
    append_if(out, add, 'a');
    append_if(out, create, 'c');
    append_if(out, write, 'w');
    append_if(out, del, 'd');
    append_if(out, list, 'l');
    return out;
}

// ============================================================================
// blob_sas_permission
// ============================================================================

auto blob_sas_permission::parse(std::string_view value) -> result<blob_sas_permission> {
    blob_sas_permission p;
    for (char c : value) {
        switch (c) {
            case 'r': p.read = true; break;
            case 'a': p.add = true; break;
            case 'c': p.create = true; break;
            case 'w': p.write = true; break;
            case 'd': p.del = true; break;
            default:
                return unexpected{unknown_character("blob permission", c, value)};
        }
    }
    return p;
}

auto blob_sas_permission::to_string() const -> std::string {
    std::string out;
    append_if(out, read, 'r');
    append_if(out, add, 'a');
    append_if(out, create, 'c');
    append_if(out, write, 'w');
    append_if(out, del, 'd');
    return out;
}

// ============================================================================
// account_sas_services / account_sas_resource_types
// ============================================================================

auto account_sas_services::parse(std::string_view value) -> result<account_sas_services> {
    account_sas_services s;
    for (char c : value) {
        switch (c) {
            case 'b': s.blob = true; break;
            case 'f': s.file = true; break;
            case 'q': s.queue = true; break;
            case 't': s.table = true; break;
            default:
                return unexpected{unknown_character("service", c, value)};
        }
    }
    return s;
}

auto account_sas_services::to_string() const -> std::string {
    std::string out;
    append_if(out, blob, 'b');
    append_if(out, file, 'f');
    append_if(out, queue, 'q');
    append_if(out, table, 't');
    return out;
}

auto account_sas_resource_types::parse(std::string_view value)
    -> result<account_sas_resource_types> {
    account_sas_resource_types r;
    for (char c : value) {
        switch (c) {
            case 's': r.service = true; break;
            case 'c': r.container = true; break;
            case 'o': r.object = true; break;
            default:
                return unexpected{unknown_character("resource type", c, value)};
        }
    }
    return r;
}

auto account_sas_resource_types::to_string() const -> std::string {
    std::string out;
    append_if(out, service, 's');
    append_if(out, container, 'c');
    append_if(out, object, 'o');
    return out;
}

}  // namespace kcenon::blob_storage
