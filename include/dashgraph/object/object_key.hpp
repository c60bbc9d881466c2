#pragma once

#include <dashgraph/core/result.hpp>
#include <dashgraph/object/object.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace dashgraph {

// ---------------------------------------------------------------------------
// ObjectKey — identity of a cluster object, used as cache key and graph
// node key.
//
// Rules:
//   - kind and name are required
//   - api_version, namespace and uid are optional
//   - derived from identity metadata only (never resource version, labels
//     or status)
// ---------------------------------------------------------------------------
class ObjectKey {
public:
    static Result<ObjectKey, Error> Create(std::string_view api_version,
                                           std::string_view kind,
                                           std::string_view namespace_name,
                                           std::string_view name,
                                           std::string_view uid = "");

    [[nodiscard]] const std::string& ApiVersion() const noexcept { return api_version_; }
    [[nodiscard]] const std::string& Kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& Namespace() const noexcept { return namespace_; }
    [[nodiscard]] const std::string& Name() const noexcept { return name_; }
    [[nodiscard]] const std::string& Uid() const noexcept { return uid_; }

    /// "obj:<apiVersion>:<kind>:<namespace>:<name>"
    [[nodiscard]] std::string ToString() const;

    /// Graph node id: the uid when the object has one, ToString() otherwise.
    [[nodiscard]] std::string NodeId() const;

    bool operator==(const ObjectKey& other) const {
        return api_version_ == other.api_version_ && kind_ == other.kind_ &&
               namespace_ == other.namespace_ && name_ == other.name_ &&
               uid_ == other.uid_;
    }
    bool operator!=(const ObjectKey& other) const { return !(*this == other); }
    bool operator<(const ObjectKey& other) const;

private:
    ObjectKey(std::string api_version, std::string kind, std::string namespace_name,
              std::string name, std::string uid)
        : api_version_(std::move(api_version)), kind_(std::move(kind)),
          namespace_(std::move(namespace_name)), name_(std::move(name)),
          uid_(std::move(uid)) {}

    std::string api_version_;
    std::string kind_;
    std::string namespace_;
    std::string name_;
    std::string uid_;
};

/// Derive the key of `object`. Fails with InvalidObject when kind or name is
/// missing.
[[nodiscard]] Result<ObjectKey, Error> KeyFromObject(const Object& object);

} // namespace dashgraph

namespace std {

template <>
struct hash<dashgraph::ObjectKey> {
    size_t operator()(const dashgraph::ObjectKey& k) const noexcept {
        size_t seed = hash<string>{}(k.ToString());
        seed ^= hash<string>{}(k.Uid()) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        return seed;
    }
};

} // namespace std
