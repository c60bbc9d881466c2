#include <dashgraph/resourceviewer/resource_viewer.hpp>

#include <dashgraph/core/log.hpp>
#include <dashgraph/object/object_key.hpp>

#include <utility>

namespace dashgraph {

namespace {

constexpr const char* kLogComponent = "resource-viewer";

Error MakeConfigurationError(const std::string& message) {
    return Error{"ResourceViewer", "", message, std::nullopt,
                 ErrorCategory::Configuration};
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Collector — IObjectHandler over the viewer's graph.
// ---------------------------------------------------------------------------
class ResourceViewer::Collector : public IObjectHandler {
public:
    explicit Collector(ResourceViewer& viewer) : viewer_(viewer) {}

    Result<void, Error> Process(const Context&, const Object& object) override {
        auto key = KeyFromObject(object);
        if (key.IsErr()) {
            return Result<void, Error>::Err(std::move(key).Error());
        }
        std::lock_guard<std::mutex> lock(viewer_.mutex_);
        viewer_.graph_.AddNode(object, key.Value());
        return Result<void, Error>::Ok();
    }

    Result<void, Error> AddChild(const Object& parent, const Object& child) override {
        auto parent_key = KeyFromObject(parent);
        if (parent_key.IsErr()) {
            return Result<void, Error>::Err(std::move(parent_key).Error());
        }
        auto child_key = KeyFromObject(child);
        if (child_key.IsErr()) {
            return Result<void, Error>::Err(std::move(child_key).Error());
        }
        std::lock_guard<std::mutex> lock(viewer_.mutex_);
        viewer_.graph_.AddEdge(parent_key.Value(), child_key.Value());
        return Result<void, Error>::Ok();
    }

private:
    ResourceViewer& viewer_;
};

// ---------------------------------------------------------------------------
// Options
// ---------------------------------------------------------------------------
ViewerOpt WithVisitor(std::shared_ptr<IVisitor> visitor) {
    return [visitor = std::move(visitor)](ResourceViewer& rv) -> Result<void, Error> {
        return rv.SetVisitor(visitor);
    };
}

ViewerOpt WithDefaultQueryer(std::shared_ptr<IQueryer> queryer) {
    return [queryer = std::move(queryer)](ResourceViewer& rv) -> Result<void, Error> {
        if (!queryer) {
            return Result<void, Error>::Err(MakeConfigurationError("queryer is null"));
        }
        return rv.SetVisitor(std::make_shared<DefaultVisitor>(queryer, rv.Handler()));
    };
}

// ---------------------------------------------------------------------------
// ResourceViewer
// ---------------------------------------------------------------------------
Result<std::unique_ptr<ResourceViewer>, Error> ResourceViewer::Create(
    const IDashConfig& dash_config,
    const std::vector<ViewerOpt>& options) {
    auto store = dash_config.ObjectStore();
    if (!store) {
        return Result<std::unique_ptr<ResourceViewer>, Error>::Err(
            MakeConfigurationError("dash config has no object store"));
    }

    auto rv = std::make_unique<ResourceViewer>(PrivateTag{}, std::move(store));
    for (const auto& option : options) {
        auto applied = option(*rv);
        if (applied.IsErr()) {
            return Result<std::unique_ptr<ResourceViewer>, Error>::Err(
                std::move(applied).Error());
        }
    }

    if (!rv->visitor_) {
        return Result<std::unique_ptr<ResourceViewer>, Error>::Err(
            MakeConfigurationError("no visitor configured"));
    }
    return Result<std::unique_ptr<ResourceViewer>, Error>::Ok(std::move(rv));
}

ResourceViewer::ResourceViewer(PrivateTag, std::shared_ptr<IObjectStore> object_store)
    : object_store_(std::move(object_store)),
      collector_(std::make_unique<Collector>(*this)) {}

ResourceViewer::~ResourceViewer() = default;

Result<void, Error> ResourceViewer::SetVisitor(std::shared_ptr<IVisitor> visitor) {
    if (!visitor) {
        return Result<void, Error>::Err(MakeConfigurationError("visitor is null"));
    }
    visitor_ = std::move(visitor);
    return Result<void, Error>::Ok();
}

IObjectHandler& ResourceViewer::Handler() {
    return *collector_;
}

Result<ComponentPtr, Error> ResourceViewer::Component(const Object& object) {
    auto key = KeyFromObject(object);
    if (key.IsErr()) {
        return Result<ComponentPtr, Error>::Err(std::move(key).Error());
    }
    SeedRoot(object, key.Value());
    return Result<ComponentPtr, Error>::Ok(Snapshot());
}

void ResourceViewer::SetRootPath(std::string path) {
    std::lock_guard<std::mutex> lock(mutex_);
    graph_.SetRootPath(std::move(path));
}

Result<ComponentPtr, Error> ResourceViewer::Visit(const Context& ctx, const Object& object) {
    auto key = KeyFromObject(object);
    if (key.IsErr()) {
        return Result<ComponentPtr, Error>::Err(std::move(key).Error());
    }
    if (!visitor_) {
        return Result<ComponentPtr, Error>::Err(MakeConfigurationError("no visitor configured"));
    }
    const auto& root_key = key.Value();
    SeedRoot(object, root_key);

    const auto root = RefreshRoot(ctx, object, root_key);

    auto visited = visitor_->Visit(ctx, root);
    if (visited.IsErr()) {
        LogDebug(kLogComponent, "visit of " + root_key.ToString() + " failed: " +
                                    visited.Error().ToString());
        return Result<ComponentPtr, Error>::Err(std::move(visited).Error());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto resolved = graph_.ResolveRoot();
        if (resolved.IsErr()) {
            return Result<ComponentPtr, Error>::Err(std::move(resolved).Error());
        }
    }
    LogDebug(kLogComponent, "resolved root " + root_key.ToString() + " as node " +
                                root_key.NodeId());
    return Result<ComponentPtr, Error>::Ok(Snapshot());
}

RootState ResourceViewer::RootStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return graph_.State();
}

void ResourceViewer::SeedRoot(const Object& object, const ObjectKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    graph_.SetPendingRoot(object, key);
}

// The stored copy of the root, when the store has one, is newer than what
// the caller handed in. A store failure is not fatal for the graph.
// The store ignores uids, so its copy may map to another node id than the
// seeded root; walking it would add the root twice.
Object ResourceViewer::RefreshRoot(const Context& ctx, const Object& object,
                                   const ObjectKey& key) {
    auto stored = object_store_->Get(ctx, key);
    if (stored.IsErr()) {
        LogWarn(kLogComponent, "object store lookup failed, using given object: " +
                                   stored.Error().ToString());
        return object;
    }
    if (!stored.Value().has_value()) {
        return object;
    }

    auto stored_key = KeyFromObject(*stored.Value());
    if (stored_key.IsErr()) {
        LogWarn(kLogComponent, "stored copy of " + key.ToString() + " is invalid: " +
                                   stored_key.Error().ToString());
        return object;
    }
    const auto seeded_id = [&] {
        std::lock_guard<std::mutex> lock(mutex_);
        return graph_.SeededRootId();
    }();
    if (stored_key.Value().NodeId() != seeded_id) {
        LogDebug(kLogComponent, "stored copy of " + key.ToString() + " has node id " +
                                    stored_key.Value().NodeId() + ", root is " + seeded_id +
                                    "; using given object");
        return object;
    }
    return *stored.Value();
}

ComponentPtr ResourceViewer::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_shared<const ResourceViewerComponent>(graph_.Nodes(),
                                                           graph_.RootNodeId());
}

} // namespace dashgraph
