// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#ifndef SKYFETCH_EXCEPTION_EXCEPTION_HPP
#define SKYFETCH_EXCEPTION_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace skyfetch {

// ============================================================================
// Target Exceptions
// ============================================================================

/**
 * @brief Thrown when a numeric or sexagesimal target token is malformed or
 * out of range.
 */
class CoordinateParseError : public atom::error::Exception {
public:
    using Exception::Exception;
};

/**
 * @brief Thrown when an object name cannot be resolved to coordinates.
 */
class NameResolutionError : public atom::error::Exception {
public:
    using Exception::Exception;
};

// ============================================================================
// Transport Exceptions
// ============================================================================

/**
 * @brief Thrown when the transport layer cannot be initialized or a request
 * fails in a way the caller cannot recover from.
 */
class NetworkError : public atom::error::Exception {
public:
    using Exception::Exception;
};

// ============================================================================
// Configuration Exceptions
// ============================================================================

/**
 * @brief Thrown when a call or configuration is invalid before any work
 * starts (worker count, field of view, cache capacity...).
 */
class InvalidConfigurationError : public atom::error::Exception {
public:
    using Exception::Exception;
};

/**
 * @brief Thrown when a requested survey id is not part of the catalog.
 */
class UnknownSurveyError : public InvalidConfigurationError {
public:
    using InvalidConfigurationError::InvalidConfigurationError;
};

// ============================================================================
// Ingestion Exceptions
// ============================================================================

/**
 * @brief Thrown when a target catalog file cannot be read.
 */
class CatalogReadError : public atom::error::Exception {
public:
    using Exception::Exception;
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define THROW_COORDINATE_PARSE_ERROR(...)                               \
    throw skyfetch::CoordinateParseError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                         ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_NAME_RESOLUTION_ERROR(...)                               \
    throw skyfetch::NameResolutionError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                        ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_NETWORK_ERROR(...)                                \
    throw skyfetch::NetworkError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                 ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_CONFIGURATION(...)                                     \
    throw skyfetch::InvalidConfigurationError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                              ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_UNKNOWN_SURVEY(...)                                     \
    throw skyfetch::UnknownSurveyError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                       ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_CATALOG_READ_ERROR(...)                               \
    throw skyfetch::CatalogReadError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                     ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace skyfetch

#endif  // SKYFETCH_EXCEPTION_EXCEPTION_HPP
