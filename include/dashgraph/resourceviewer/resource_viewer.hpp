#pragma once

#include <dashgraph/component/resource_viewer_component.hpp>
#include <dashgraph/core/context.hpp>
#include <dashgraph/core/result.hpp>
#include <dashgraph/dash/i_dash_config.hpp>
#include <dashgraph/graph/resource_graph.hpp>
#include <dashgraph/object/i_object_store.hpp>
#include <dashgraph/object/i_queryer.hpp>
#include <dashgraph/objectvisitor/visitor.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dashgraph {

class ResourceViewer;

using ViewerOpt = std::function<Result<void, Error>(ResourceViewer&)>;

/// Use `visitor` instead of the default one.
[[nodiscard]] ViewerOpt WithVisitor(std::shared_ptr<IVisitor> visitor);

/// Use a DefaultVisitor that expands objects through `queryer`.
[[nodiscard]] ViewerOpt WithDefaultQueryer(std::shared_ptr<IQueryer> queryer);

// ---------------------------------------------------------------------------
// ResourceViewer — one graph-building session for a single root object.
//
// Owns the mutable graph and the visitor that populates it. The root is
// seeded under the placeholder id and re-keyed to its real id after a
// successful Visit. Snapshots may be taken from any thread while a Visit
// is running.
// ---------------------------------------------------------------------------
class ResourceViewer {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// Fails with Configuration when the dash configuration has no object
    /// store, an option rejects its argument, or no visitor was configured.
    static Result<std::unique_ptr<ResourceViewer>, Error> Create(
        const IDashConfig& dash_config,
        const std::vector<ViewerOpt>& options = {});

    ResourceViewer(PrivateTag, std::shared_ptr<IObjectStore> object_store);
    ~ResourceViewer();

    ResourceViewer(const ResourceViewer&) = delete;
    ResourceViewer& operator=(const ResourceViewer&) = delete;
    ResourceViewer(ResourceViewer&&) = delete;
    ResourceViewer& operator=(ResourceViewer&&) = delete;

    /// Fails with Configuration on a null visitor.
    [[nodiscard]] Result<void, Error> SetVisitor(std::shared_ptr<IVisitor> visitor);

    /// Handler that records visited objects into this viewer's graph.
    [[nodiscard]] IObjectHandler& Handler();

    /// Seed the pending root for `object` if needed and return the current
    /// graph. Does not traverse.
    [[nodiscard]] Result<ComponentPtr, Error> Component(const Object& object);

    /// Attach a display path to the root node.
    void SetRootPath(std::string path);

    /// Traverse from `object` and return the resolved graph. A stored copy
    /// of the root is walked only when it maps to the seeded root node.
    [[nodiscard]] Result<ComponentPtr, Error> Visit(const Context& ctx,
                                                    const Object& object);

    [[nodiscard]] RootState RootStatus() const;

private:
    class Collector;

    void SeedRoot(const Object& object, const ObjectKey& key);
    Object RefreshRoot(const Context& ctx, const Object& object, const ObjectKey& key);
    ComponentPtr Snapshot() const;

    std::shared_ptr<IObjectStore> object_store_;
    std::shared_ptr<IVisitor> visitor_;
    std::unique_ptr<Collector> collector_;

    mutable std::mutex mutex_;
    ResourceGraph graph_;
};

} // namespace dashgraph
