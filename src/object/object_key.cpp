#include <dashgraph/object/object_key.hpp>

#include <tuple>

namespace dashgraph {

Result<ObjectKey, Error> ObjectKey::Create(std::string_view api_version,
                                           std::string_view kind,
                                           std::string_view namespace_name,
                                           std::string_view name,
                                           std::string_view uid) {
    if (kind.empty()) {
        return Result<ObjectKey, Error>::Err(Error{
            "KeyFromObject", std::string(name), "object has no kind",
            std::nullopt, ErrorCategory::InvalidObject});
    }
    if (name.empty()) {
        return Result<ObjectKey, Error>::Err(Error{
            "KeyFromObject", std::string(kind), "object has no name",
            std::nullopt, ErrorCategory::InvalidObject});
    }
    return Result<ObjectKey, Error>::Ok(ObjectKey(
        std::string(api_version), std::string(kind), std::string(namespace_name),
        std::string(name), std::string(uid)));
}

std::string ObjectKey::ToString() const {
    return "obj:" + api_version_ + ":" + kind_ + ":" + namespace_ + ":" + name_;
}

std::string ObjectKey::NodeId() const {
    if (!uid_.empty()) {
        return uid_;
    }
    return ToString();
}

bool ObjectKey::operator<(const ObjectKey& other) const {
    return std::tie(api_version_, kind_, namespace_, name_, uid_) <
           std::tie(other.api_version_, other.kind_, other.namespace_,
                    other.name_, other.uid_);
}

Result<ObjectKey, Error> KeyFromObject(const Object& object) {
    return ObjectKey::Create(object.api_version, object.kind,
                             object.namespace_name, object.name, object.uid);
}

} // namespace dashgraph
