// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for async_sftp
 *
 * Central entry point for feature detection and integration flags.
 *
 * Feature categories:
 * - ASYNC_SFTP_HAS_*     : Local feature availability (libssh2 backend)
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <async_sftp/config/feature_flags.h>
 *
 * #if ASYNC_SFTP_HAS_LIBSSH2
 *     auto session = std::make_unique<libssh2_session>();
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
#define ASYNC_SFTP_HAS_COMMON_FEATURE_FLAGS 1
#else
#define ASYNC_SFTP_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// async_sftp Feature Flags
//==============================================================================

/**
 * @brief libssh2 session backend
 *
 * When enabled, libssh2_session is compiled and becomes the default session
 * of sftp_client::builder. Set via CMake when libssh2 is found.
 */
#ifndef ASYNC_SFTP_HAS_LIBSSH2
    #if defined(ASYNC_SFTP_ENABLE_LIBSSH2)
        #define ASYNC_SFTP_HAS_LIBSSH2 1
    #else
        #define ASYNC_SFTP_HAS_LIBSSH2 0
    #endif
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

// thread_system integration (single-worker thread_pool per connection)
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

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Unified flag for logger_system usage in async_sftp
 *
 * logger_system needs common_system for its result types, so both must be
 * present.
 */
#ifndef ASYNC_SFTP_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define ASYNC_SFTP_USE_LOGGER_SYSTEM 1
    #else
        #define ASYNC_SFTP_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef ASYNC_SFTP_PRINT_FEATURE_SUMMARY

#pragma message("=== async_sftp Feature Summary ===")

#if ASYNC_SFTP_HAS_LIBSSH2
    #pragma message("  libssh2 session: Enabled")
#else
    #pragma message("  libssh2 session: Disabled")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available")
#endif

#if ASYNC_SFTP_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#pragma message("==================================")

#endif  // ASYNC_SFTP_PRINT_FEATURE_SUMMARY
