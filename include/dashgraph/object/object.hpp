#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace dashgraph {

// ---------------------------------------------------------------------------
// OwnerReference — link from an object to the object that controls it.
// ---------------------------------------------------------------------------
struct OwnerReference {
    std::string api_version;
    std::string kind;
    std::string name;
    std::string uid;
    bool controller = false;
};

// ---------------------------------------------------------------------------
// Object — a cluster object as handed over by the object store or queryer.
//
// Identity is (api_version, kind, namespace_name, name, uid). Everything else
// is content: it may change between reads without changing the object's key.
// ---------------------------------------------------------------------------
struct Object {
    std::string api_version;     // e.g. "apps/v1"
    std::string kind;            // e.g. "Deployment"
    std::string namespace_name;  // empty for cluster-scoped objects
    std::string name;
    std::string uid;
    std::string resource_version;
    std::map<std::string, std::string> labels;
    std::vector<OwnerReference> owner_references;
    nlohmann::json status = nlohmann::json::object();
};

} // namespace dashgraph
