/**
 * @file PathCatalog.hpp
 * @brief Candidate HTTP paths probed during route discovery.
 *
 * The catalog holds a curated common set and per-framework path lists. The
 * comprehensive set is the deduplicated union of all lists.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

namespace portsy::core {

/**
 * @brief Which candidate path set route discovery uses.
 */
enum class PathSetMode : int {
    Common = 0,       ///< Curated set of widely used paths
    Comprehensive = 1 ///< Union of every framework-specific list
};

/**
 * @brief Catalog of candidate paths for route discovery.
 */
class PathCatalog {
public:
    /**
     * @brief Returns the built-in catalog (common set plus framework lists).
     */
    static PathCatalog defaults();

    PathCatalog() = default;

    /**
     * @brief Returns the candidate paths for the given mode.
     * @param mode Common or comprehensive set.
     * @return Paths in probe order. The comprehensive set is sorted and unique.
     */
    [[nodiscard]] std::vector<std::string> paths(PathSetMode mode) const;

    [[nodiscard]] const std::vector<std::string>& commonPaths() const { return common_; }

    [[nodiscard]] const std::map<std::string, std::vector<std::string>>& frameworks() const {
        return frameworks_;
    }

    /**
     * @brief Replaces the common set.
     */
    void setCommonPaths(std::vector<std::string> paths);

    /**
     * @brief Adds or replaces a framework-specific list.
     * @param name Framework key (e.g. "flask").
     * @param paths Paths for that framework.
     */
    void setFrameworkPaths(const std::string& name, std::vector<std::string> paths);

    /**
     * @brief Converts a mode to its name ("common" or "comprehensive").
     */
    static std::string modeToString(PathSetMode mode);

private:
    std::vector<std::string> common_;
    std::map<std::string, std::vector<std::string>> frameworks_;
};

} // namespace portsy::core
