#include "abp/foundation/config_manager.hpp"

#include <algorithm>

namespace abp::foundation {

PlannerResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::LoadFile(path.string());
        entries_.clear();
        flatten("", root);
        return PlannerResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return PlannerResult<void>::err(
            PlannerError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return PlannerResult<void>::err(
            PlannerError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

PlannerResult<void> ConfigManager::loadFromString(std::string_view document) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::Load(std::string(document));
        entries_.clear();
        flatten("", root);
        return PlannerResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return PlannerResult<void>::err(
            PlannerError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::childKeys(std::string_view prefix) const {
    std::lock_guard lock(mutex_);
    std::string head(prefix);
    head += '.';

    std::vector<std::string> children;
    for (const auto& [key, node] : entries_) {
        if (key.size() <= head.size() || key.compare(0, head.size(), head) != 0) {
            continue;
        }
        auto rest = key.substr(head.size());
        auto dot = rest.find('.');
        auto child = dot == std::string::npos ? rest : rest.substr(0, dot);
        if (std::find(children.begin(), children.end(), child) == children.end()) {
            children.push_back(std::move(child));
        }
    }
    std::sort(children.begin(), children.end());
    return children;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        // Scalars, sequences and nulls are leaves.
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace abp::foundation
