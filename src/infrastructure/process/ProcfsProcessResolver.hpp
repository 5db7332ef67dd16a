#pragma once

#include "core/services/IProcessResolver.hpp"

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>

namespace portsy::infra {

/**
 * @brief Resolves port owners by reading the Linux procfs.
 *
 * Finds LISTEN sockets for the port in net/tcp and net/tcp6, then walks the
 * fd directory of every process looking for a matching socket inode. The
 * first process found in directory order wins. Processes whose fd directory
 * is not readable (other users without privileges) are skipped.
 *
 * @note On platforms other than Linux resolve() always returns nullopt.
 */
class ProcfsProcessResolver : public core::IProcessResolver {
public:
    /**
     * @brief Constructs a resolver over the given procfs mount.
     * @param procRoot Root of the proc filesystem.
     */
    explicit ProcfsProcessResolver(std::filesystem::path procRoot = "/proc");

    /**
     * @brief Resolves the process listening on a TCP port.
     * @param port Local port.
     * @return Process information, or nullopt if no readable owner was found.
     */
    std::optional<core::ProcessInfo> resolve(uint16_t port) override;

    /**
     * @brief Returns inodes of LISTEN sockets bound to the port.
     * @param port Local port.
     * @return Socket inodes from net/tcp and net/tcp6.
     */
    [[nodiscard]] std::set<std::string> listeningInodes(uint16_t port) const;

    /**
     * @brief Reads name and command line of a process.
     * @param pid Process identifier.
     * @return Process information, or nullopt if the process vanished.
     */
    [[nodiscard]] std::optional<core::ProcessInfo> readProcess(int pid) const;

private:
    [[nodiscard]] std::optional<int> findSocketOwner(const std::set<std::string>& inodes) const;

    std::filesystem::path procRoot_;
};

} // namespace portsy::infra
