#pragma once

#include <dashgraph/core/context.hpp>
#include <dashgraph/core/result.hpp>
#include <dashgraph/object/i_queryer.hpp>
#include <dashgraph/object/object.hpp>

#include <memory>
#include <set>
#include <string>

namespace dashgraph {

// ---------------------------------------------------------------------------
// IObjectHandler — receives what a visitor discovers.
// ---------------------------------------------------------------------------
class IObjectHandler {
public:
    virtual ~IObjectHandler() = default;

    /// Record `object` as a node.
    [[nodiscard]] virtual Result<void, Error> Process(const Context& ctx,
                                                      const Object& object) = 0;

    /// Record that `child` was discovered under `parent`.
    [[nodiscard]] virtual Result<void, Error> AddChild(const Object& parent,
                                                       const Object& child) = 0;
};

// ---------------------------------------------------------------------------
// IVisitor — invoked on a root object; visits everything reachable from it.
// ---------------------------------------------------------------------------
class IVisitor {
public:
    virtual ~IVisitor() = default;

    [[nodiscard]] virtual Result<void, Error> Visit(const Context& ctx,
                                                    const Object& object) = 0;
};

// ---------------------------------------------------------------------------
// DefaultVisitor — depth-first walk driven by the queryer.
//
// Each object is processed once per Visit call (by node id), which makes
// revisits and cycles terminate. Every (parent, child) pair is reported to
// the handler, so edges are complete even for revisited objects.
//
// A queryer failure becomes a ChildLookup error and stops that branch only;
// siblings are still visited and the first error is returned. Cancellation
// stops the whole walk at once.
// ---------------------------------------------------------------------------
class DefaultVisitor : public IVisitor {
public:
    DefaultVisitor(std::shared_ptr<IQueryer> queryer, IObjectHandler& handler);

    [[nodiscard]] Result<void, Error> Visit(const Context& ctx,
                                            const Object& object) override;

private:
    Result<void, Error> VisitObject(const Context& ctx, const Object& object,
                                    std::set<std::string>& visited);

    std::shared_ptr<IQueryer> queryer_;
    IObjectHandler& handler_;
};

} // namespace dashgraph
