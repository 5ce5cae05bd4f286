#include "acl_registry.h"

#include <optional>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Meshwork {

namespace {

bool ParseManifest(const YAML::Node& root, AclRegistry& registry,
                   std::vector<std::string>* errors) {
    std::vector<std::string> local_errors;
    std::vector<NamespaceRule> rules;
    // Without default_policy the registry keeps the configured default.
    std::optional<bool> default_allow;

    if (root["default_policy"]) {
        std::string policy = root["default_policy"].as<std::string>();
        if (policy == "allow" || policy == "deny") {
            default_allow = policy == "allow";
        } else {
            local_errors.push_back("default_policy must be 'deny' or 'allow', got '" + policy + "'");
        }
    }

    const YAML::Node namespaces = root["namespaces"];
    if (namespaces && !namespaces.IsSequence()) {
        local_errors.push_back("'namespaces' must be a sequence");
    } else if (namespaces) {
        absl::flat_hash_set<std::string> prefixes;
        for (const auto& node : namespaces) {
            NamespaceRule rule;
            if (!node["prefix"]) {
                local_errors.push_back("namespace entry without 'prefix'");
                continue;
            }
            rule.prefix = node["prefix"].as<std::string>();
            if (!prefixes.insert(rule.prefix).second) {
                local_errors.push_back("namespace '" + rule.prefix + "' declared twice");
                continue;
            }
            if (node["read_only"]) rule.read_only = node["read_only"].as<bool>();
            if (node["readers"]) {
                for (const auto& r : node["readers"]) rule.readers.insert(r.as<std::string>());
            }
            if (node["writers"]) {
                for (const auto& w : node["writers"]) rule.writers.insert(w.as<std::string>());
            }
            if (rule.writers.empty() && !rule.read_only) {
                local_errors.push_back("namespace '" + rule.prefix +
                                       "' is governed by zero writers; mark it read_only");
                continue;
            }
            if (!rule.writers.empty() && rule.read_only) {
                local_errors.push_back("namespace '" + rule.prefix + "' is read_only but names writers");
                continue;
            }
            rules.push_back(std::move(rule));
        }
    }

    if (!local_errors.empty()) {
        for (const auto& err : local_errors) {
            LOG(ERROR) << "ACL manifest: " << err;
        }
        if (errors != nullptr) {
            errors->insert(errors->end(), local_errors.begin(), local_errors.end());
        }
        return false;
    }

    registry.Clear();
    if (default_allow) {
        registry.SetDefaultAllow(*default_allow);
    }
    for (auto& rule : rules) {
        if (registry.AddNamespace(std::move(rule)) != MeshError::kOk) {
            return false;
        }
    }
    LOG(INFO) << "ACL manifest loaded: " << registry.NamespaceCount() << " namespaces, default "
              << (registry.DefaultAllow() ? "allow" : "deny");
    return true;
}

} // namespace

bool LoadAclManifestFile(const std::string& path, AclRegistry& registry,
                         std::vector<std::string>* errors) {
    try {
        return ParseManifest(YAML::LoadFile(path), registry, errors);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse ACL manifest " << path << ": " << e.what();
        if (errors != nullptr) errors->push_back(e.what());
        return false;
    }
}

bool LoadAclManifestString(const std::string& yaml_content, AclRegistry& registry,
                           std::vector<std::string>* errors) {
    try {
        return ParseManifest(YAML::Load(yaml_content), registry, errors);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse ACL manifest: " << e.what();
        if (errors != nullptr) errors->push_back(e.what());
        return false;
    }
}

} // namespace Meshwork
