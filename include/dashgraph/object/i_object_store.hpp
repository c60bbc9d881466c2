#pragma once

#include <dashgraph/core/context.hpp>
#include <dashgraph/core/result.hpp>
#include <dashgraph/object/object.hpp>
#include <dashgraph/object/object_key.hpp>

#include <optional>

namespace dashgraph {

// ---------------------------------------------------------------------------
// IObjectStore — read access to stored cluster objects.
//
// Get returns Ok(nullopt) when the store holds no object for `key`.
// ---------------------------------------------------------------------------
class IObjectStore {
public:
    virtual ~IObjectStore() = default;

    IObjectStore(const IObjectStore&) = delete;
    IObjectStore& operator=(const IObjectStore&) = delete;
    IObjectStore(IObjectStore&&) = delete;
    IObjectStore& operator=(IObjectStore&&) = delete;

    [[nodiscard]] virtual Result<std::optional<Object>, Error> Get(
        const Context& ctx,
        const ObjectKey& key) = 0;

protected:
    IObjectStore() = default;
};

} // namespace dashgraph
