/**
 * @file name_resolution.hpp
 * @brief Static mapping between logical service names and remote resources
 *
 * A task asks for capabilities by logical name ("filesystem", "terminal",
 * "emails", ...). The provisioning service knows resource types, some of
 * which back several logical names at once. This table holds the three
 * pieces of data needed to go from one to the other:
 *
 * - the grouped-name set, served together by one shared resource;
 * - logical name → response key, for grouped names whose endpoint is
 *   published under a different key in the shared response;
 * - logical name → resource type, for ungrouped names whose resource type
 *   differs from the logical name.
 *
 * The two remap tables are deliberately separate: a name may differ from
 * its response key, from its resource type, or from both.
 *
 * @date 2025
 */

#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace sandkeeper {
namespace core {

/// Resource type requested for the grouped-name set
inline constexpr const char* kGroupedResourceType = "local_dev";

/**
 * @struct NamePartition
 * @brief Requested names split by acquisition path
 */
struct NamePartition {
    std::vector<std::string> grouped;     ///< Served by one shared acquisition
    std::vector<std::string> ungrouped;   ///< One acquisition each
};

/**
 * @class NameResolutionTable
 * @brief Immutable name mapping data plus partition logic
 *
 * **Usage Example**:
 * @code
 * auto table = NameResolutionTable::Default();
 * auto partition = table.Partition({"filesystem", "terminal", "emails"});
 * // partition.grouped   == {"filesystem", "terminal"}
 * // partition.ungrouped == {"emails"}
 * table.ResourceTypeFor("emails");   // "poste_email_toolathlon"
 * table.ResponseKeyFor("terminal");  // "terminal"
 * @endcode
 */
class NameResolutionTable {
public:
    /**
     * @brief Build the default table
     */
    NameResolutionTable();

    /**
     * @brief Build a custom table
     * @param grouped_names Names served by the shared resource
     * @param grouped_resource_type Resource type of the shared resource
     * @param response_keys Logical name → key in the shared response
     * @param resource_types Logical name → resource type for ungrouped names
     */
    NameResolutionTable(std::set<std::string> grouped_names,
                        std::string grouped_resource_type,
                        std::map<std::string, std::string> response_keys,
                        std::map<std::string, std::string> resource_types);

    /**
     * @brief Default mapping used by the harness
     */
    static NameResolutionTable Default();

    bool IsGrouped(const std::string& name) const;

    /**
     * @brief Split requested names into grouped and ungrouped subsets
     *
     * Both subsets keep the (sorted) order of the input set.
     */
    NamePartition Partition(const std::set<std::string>& names) const;

    /**
     * @brief Key under which the shared response exposes name's endpoint
     * @return Remapped key, or name itself when no remap exists
     */
    std::string ResponseKeyFor(const std::string& name) const;

    /**
     * @brief Resource type to request for an ungrouped name
     * @return Remapped type, or name itself when no remap exists
     */
    std::string ResourceTypeFor(const std::string& name) const;

    const std::string& GroupedResourceType() const { return grouped_resource_type_; }
    const std::set<std::string>& GroupedNames() const { return grouped_names_; }
    const std::map<std::string, std::string>& ResponseKeys() const { return response_keys_; }
    const std::map<std::string, std::string>& ResourceTypes() const { return resource_types_; }

    /**
     * @brief Remote task tag for a task directory
     *
     * "finalpool/notion-personal-website" → "Toolathlon_notion_personal_website"
     */
    static std::string TaskNameFromDirectory(const std::string& task_dir);

private:
    std::set<std::string> grouped_names_;
    std::string grouped_resource_type_;
    std::map<std::string, std::string> response_keys_;
    std::map<std::string, std::string> resource_types_;
};

} // namespace core
} // namespace sandkeeper
