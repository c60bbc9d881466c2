#pragma once

#include <dashgraph/core/context.hpp>
#include <dashgraph/core/result.hpp>
#include <dashgraph/object/object.hpp>

#include <vector>

namespace dashgraph {

// ---------------------------------------------------------------------------
// IQueryer — fetches the direct children of an object from the cluster.
//
// The only mechanism for graph expansion. Implementations must honour the
// context: once ctx.Done() they should return a ContextCancelled error.
// ---------------------------------------------------------------------------
class IQueryer {
public:
    virtual ~IQueryer() = default;

    IQueryer(const IQueryer&) = delete;
    IQueryer& operator=(const IQueryer&) = delete;
    IQueryer(IQueryer&&) = delete;
    IQueryer& operator=(IQueryer&&) = delete;

    [[nodiscard]] virtual Result<std::vector<Object>, Error> Children(
        const Context& ctx,
        const Object& object) = 0;

protected:
    IQueryer() = default;
};

} // namespace dashgraph
