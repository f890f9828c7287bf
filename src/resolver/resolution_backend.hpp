// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#ifndef SKYFETCH_RESOLVER_RESOLUTION_BACKEND_HPP
#define SKYFETCH_RESOLVER_RESOLUTION_BACKEND_HPP

#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include "target/target.hpp"

namespace skyfetch::resolver {

/**
 * @brief Error information for a failed name lookup
 */
struct ResolutionError {
    /**
     * @brief Enumeration of possible error codes
     */
    enum class Code {
        NotFound,            ///< Service answered but knows no such object
        NetworkError,        ///< Transport failure or timeout
        ServiceUnavailable,  ///< 429 / 5xx answer
        ParseError,          ///< Answer could not be understood
        Unknown
    };

    Code code = Code::Unknown;
    std::string message;

    /**
     * @brief Transient errors are retried by NameResolver, the rest are not
     */
    [[nodiscard]] auto isRetryable() const noexcept -> bool {
        return code == Code::NetworkError || code == Code::ServiceUnavailable;
    }
};

using ResolutionOutcome =
    std::expected<target::ResolvedCoordinate, ResolutionError>;

/**
 * @brief Remote name resolution service contract
 *
 * One call performs exactly one remote lookup; caching and retrying are done
 * by NameResolver. Implementations must be safe to call from several
 * threads at once.
 */
class INameResolutionBackend {
public:
    virtual ~INameResolutionBackend() = default;

    /**
     * @brief Resolve a name to ICRS coordinates in degrees
     */
    [[nodiscard]] virtual auto resolveName(const std::string& name)
        -> ResolutionOutcome = 0;

    /**
     * @brief Stable identifier used in log messages
     */
    [[nodiscard]] virtual auto name() const noexcept -> std::string_view = 0;
};

using NameResolutionBackendPtr = std::shared_ptr<INameResolutionBackend>;

}  // namespace skyfetch::resolver

#endif  // SKYFETCH_RESOLVER_RESOLUTION_BACKEND_HPP
