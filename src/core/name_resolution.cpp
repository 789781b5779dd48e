/**
 * @file name_resolution.cpp
 * @brief Default name mapping and partition logic
 *
 * @date 2025
 */

#include "sandkeeper/core/name_resolution.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace sandkeeper {
namespace core {

NameResolutionTable::NameResolutionTable()
    : NameResolutionTable(
          // Served by one local_dev sandbox
          {"filesystem", "terminal"},
          kGroupedResourceType,
          {},
          {
              {"emails", "poste_email_toolathlon"},
          }) {
}

NameResolutionTable::NameResolutionTable(std::set<std::string> grouped_names,
                                         std::string grouped_resource_type,
                                         std::map<std::string, std::string> response_keys,
                                         std::map<std::string, std::string> resource_types)
    : grouped_names_(std::move(grouped_names))
    , grouped_resource_type_(std::move(grouped_resource_type))
    , response_keys_(std::move(response_keys))
    , resource_types_(std::move(resource_types)) {
}

NameResolutionTable NameResolutionTable::Default() {
    return NameResolutionTable();
}

bool NameResolutionTable::IsGrouped(const std::string& name) const {
    return grouped_names_.count(name) > 0;
}

NamePartition NameResolutionTable::Partition(const std::set<std::string>& names) const {
    NamePartition partition;
    for (const auto& name : names) {
        if (IsGrouped(name)) {
            partition.grouped.push_back(name);
        } else {
            partition.ungrouped.push_back(name);
        }
    }

    spdlog::debug("Partitioned {} names: {} grouped, {} ungrouped",
                  names.size(), partition.grouped.size(), partition.ungrouped.size());
    return partition;
}

std::string NameResolutionTable::ResponseKeyFor(const std::string& name) const {
    auto it = response_keys_.find(name);
    return it != response_keys_.end() ? it->second : name;
}

std::string NameResolutionTable::ResourceTypeFor(const std::string& name) const {
    auto it = resource_types_.find(name);
    return it != resource_types_.end() ? it->second : name;
}

std::string NameResolutionTable::TaskNameFromDirectory(const std::string& task_dir) {
    std::string task_name = task_dir;

    auto slash = task_name.find_last_of('/');
    if (slash != std::string::npos) {
        task_name = task_name.substr(slash + 1);
    }
    std::replace(task_name.begin(), task_name.end(), '-', '_');

    return "Toolathlon_" + task_name;
}

} // namespace core
} // namespace sandkeeper
