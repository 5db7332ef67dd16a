/**
 * @file IProcessResolver.hpp
 * @brief Interface for mapping a listening port to its owning process.
 */

#pragma once

#include "core/types/Service.hpp"

#include <cstdint>
#include <optional>

namespace portsy::core {

/**
 * @brief Looks up the process bound to a local TCP port.
 */
class IProcessResolver {
public:
    virtual ~IProcessResolver() = default;

    /**
     * @brief Resolves the owner of a listening port.
     *
     * When several processes share the port, the first match reported by the
     * underlying OS facility is returned; callers must not rely on which one.
     *
     * @param port Port that was found open.
     * @return Process information, or nullopt if it could not be determined
     *         (no match, permission denied, platform not supported).
     */
    virtual std::optional<ProcessInfo> resolve(uint16_t port) = 0;
};

} // namespace portsy::core
