#pragma once

#include <dashgraph/object/object.hpp>
#include <dashgraph/object/object_key.hpp>

#include <string>
#include <utility>

namespace dashgraph {
namespace testing {

inline Object MakeObject(std::string api_version, std::string kind, std::string name,
                         std::string uid = "", std::string namespace_name = "default") {
    Object object;
    object.api_version = std::move(api_version);
    object.kind = std::move(kind);
    object.name = std::move(name);
    object.uid = std::move(uid);
    object.namespace_name = std::move(namespace_name);
    return object;
}

inline Object Deployment() {
    return MakeObject("apps/v1", "Deployment", "deployment", "deployment");
}

inline Object ReplicaSet() {
    return MakeObject("apps/v1", "ReplicaSet", "replica-set", "replica-set");
}

inline Object Pod(const std::string& name) {
    return MakeObject("v1", "Pod", name, name);
}

inline ObjectKey KeyOf(const Object& object) {
    return KeyFromObject(object).Value();
}

} // namespace testing
} // namespace dashgraph
