#include "infrastructure/process/ProcfsProcessResolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>
#include <vector>

namespace portsy::infra {

namespace {

constexpr const char* kTcpListenState = "0A";
constexpr const char* kSocketPrefix = "socket:[";

bool isNumeric(const std::string& str) {
    return !str.empty() && std::all_of(str.begin(), str.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c));
    });
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return {};
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

std::string trimRight(std::string str) {
    while (!str.empty() && (str.back() == '\n' || str.back() == ' ' || str.back() == '\0')) {
        str.pop_back();
    }
    return str;
}

// Parses "0100007F:0BB9" and returns the port part.
std::optional<unsigned long> parseHexPort(const std::string& address) {
    auto colon = address.rfind(':');
    if (colon == std::string::npos || colon + 1 >= address.size()) {
        return std::nullopt;
    }
    try {
        return std::stoul(address.substr(colon + 1), nullptr, 16);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

ProcfsProcessResolver::ProcfsProcessResolver(std::filesystem::path procRoot)
    : procRoot_(std::move(procRoot)) {}

std::optional<core::ProcessInfo> ProcfsProcessResolver::resolve(uint16_t port) {
#ifdef __linux__
    auto inodes = listeningInodes(port);
    if (inodes.empty()) {
        spdlog::debug("No listening socket found for port {}", port);
        return std::nullopt;
    }

    auto pid = findSocketOwner(inodes);
    if (!pid) {
        spdlog::debug("No readable process owns the socket on port {}", port);
        return std::nullopt;
    }

    return readProcess(*pid);
#else
    spdlog::warn("Process resolution is not implemented for this platform (port {})", port);
    return std::nullopt;
#endif
}

std::set<std::string> ProcfsProcessResolver::listeningInodes(uint16_t port) const {
    std::set<std::string> inodes;

    for (const char* table : {"net/tcp", "net/tcp6"}) {
        std::ifstream file(procRoot_ / table);
        if (!file) {
            continue;
        }

        std::string line;
        std::getline(file, line); // Column header

        while (std::getline(file, line)) {
            std::istringstream iss(line);
            std::vector<std::string> tokens{std::istream_iterator<std::string>(iss),
                                            std::istream_iterator<std::string>()};
            // sl local rem st tx:rx tr:when retrnsmt uid timeout inode
            if (tokens.size() < 10 || tokens[3] != kTcpListenState) {
                continue;
            }

            auto localPort = parseHexPort(tokens[1]);
            if (!localPort || *localPort != port) {
                continue;
            }

            if (tokens[9] != "0") {
                inodes.insert(tokens[9]);
            }
        }
    }

    return inodes;
}

std::optional<int> ProcfsProcessResolver::findSocketOwner(
    const std::set<std::string>& inodes) const {
    std::error_code ec;
    std::filesystem::directory_iterator procIt(procRoot_, ec);
    if (ec) {
        spdlog::debug("Cannot read {}: {}", procRoot_.string(), ec.message());
        return std::nullopt;
    }

    // Entries can vanish while iterating, so advance with error codes
    for (auto end = std::filesystem::directory_iterator(); procIt != end; procIt.increment(ec)) {
        if (ec) {
            break;
        }

        auto name = procIt->path().filename().string();
        if (!isNumeric(name)) {
            continue;
        }

        std::error_code fdEc;
        std::filesystem::directory_iterator fdIt(procIt->path() / "fd", fdEc);
        for (; !fdEc && fdIt != end; fdIt.increment(fdEc)) {
            std::error_code linkEc;
            auto target = std::filesystem::read_symlink(fdIt->path(), linkEc).string();
            if (linkEc || target.rfind(kSocketPrefix, 0) != 0 || target.back() != ']') {
                continue;
            }

            auto inode = target.substr(std::char_traits<char>::length(kSocketPrefix));
            inode.pop_back();
            if (inodes.count(inode) > 0) {
                return std::stoi(name);
            }
        }
    }

    return std::nullopt;
}

std::optional<core::ProcessInfo> ProcfsProcessResolver::readProcess(int pid) const {
    auto processDir = procRoot_ / std::to_string(pid);

    std::error_code ec;
    if (!std::filesystem::exists(processDir, ec)) {
        return std::nullopt;
    }

    core::ProcessInfo info;
    info.pid = pid;
    info.name = trimRight(readFile(processDir / "comm"));

    auto cmdline = trimRight(readFile(processDir / "cmdline"));
    std::replace(cmdline.begin(), cmdline.end(), '\0', ' ');
    info.commandLine = cmdline;

    if (info.name.empty() && info.commandLine.empty()) {
        return std::nullopt;
    }
    return info;
}

} // namespace portsy::infra
