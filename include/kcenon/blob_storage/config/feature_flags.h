// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for blob_storage_system
 *
 * Central entry point for feature detection in the blob_storage_system
 * library. Include this header to get access to the BLOB_STORAGE_HAS_* and
 * KCENON_WITH_* feature macros.
 *
 * Feature categories:
 * - BLOB_STORAGE_HAS_*   : Local feature availability
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <kcenon/blob_storage/config/feature_flags.h>
 *
 * #if KCENON_WITH_NETWORK_SYSTEM
 *     auto transport = make_network_http_transport();
 * #endif
 * @endcode
 *
 * @see common_system/config/feature_flags.h for upstream feature detection
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define BLOB_STORAGE_HAS_COMMON_FEATURE_FLAGS 1
#else
#define BLOB_STORAGE_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// Blob Storage System Feature Flags
//==============================================================================

/**
 * @brief Request signing support (OpenSSL)
 *
 * Shared-key and SAS signing require HMAC-SHA256. OpenSSL is a hard
 * dependency of the library, so this is always on unless explicitly
 * overridden for a header-only consumer.
 */
#ifndef BLOB_STORAGE_HAS_SIGNING
    #define BLOB_STORAGE_HAS_SIGNING 1
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

// common_system integration
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (thread_pool for asynchronous pipeline sends)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

// network_system integration (HTTP transport)
#ifndef KCENON_WITH_NETWORK_SYSTEM
    #if defined(BUILD_WITH_NETWORK_SYSTEM)
        #define KCENON_WITH_NETWORK_SYSTEM 1
    #else
        #define KCENON_WITH_NETWORK_SYSTEM 0
    #endif
#endif

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Unified flag for logger_system usage in blob_storage
 *
 * Considers both the KCENON_WITH_LOGGER_SYSTEM flag and the legacy
 * BUILD_WITH_LOGGER_SYSTEM macro.
 */
#ifndef BLOB_STORAGE_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define BLOB_STORAGE_USE_LOGGER_SYSTEM 1
    #elif defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
        #define BLOB_STORAGE_USE_LOGGER_SYSTEM 1
    #else
        #define BLOB_STORAGE_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Legacy Alias Support
//==============================================================================

#ifndef BLOB_STORAGE_DISABLE_LEGACY_ALIASES

#ifndef BUILD_WITH_COMMON_SYSTEM
    #if KCENON_WITH_COMMON_SYSTEM
        #define BUILD_WITH_COMMON_SYSTEM 1
    #endif
#endif

#ifndef BUILD_WITH_THREAD_SYSTEM
    #if KCENON_WITH_THREAD_SYSTEM
        #define BUILD_WITH_THREAD_SYSTEM 1
    #endif
#endif

#ifndef BUILD_WITH_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM
        #define BUILD_WITH_LOGGER_SYSTEM 1
    #endif
#endif

#ifndef BUILD_WITH_NETWORK_SYSTEM
    #if KCENON_WITH_NETWORK_SYSTEM
        #define BUILD_WITH_NETWORK_SYSTEM 1
    #endif
#endif

#endif // BLOB_STORAGE_DISABLE_LEGACY_ALIASES

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef BLOB_STORAGE_PRINT_FEATURE_SUMMARY

#pragma message("=== Blob Storage System Feature Summary ===")

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available")
#endif

#if KCENON_WITH_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system: Available")
#else
    #pragma message("  network_system: Not Available")
#endif

#pragma message("===========================================")

#endif // BLOB_STORAGE_PRINT_FEATURE_SUMMARY
