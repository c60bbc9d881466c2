#include <dashgraph/resourceviewer/component_cache.hpp>

#include <dashgraph/core/log.hpp>

#include <exception>
#include <string>
#include <utility>

namespace dashgraph {

namespace {

constexpr const char* kLogComponent = "component-cache";

Error MakeNoQueryerError() {
    return Error{"ComponentCache::Get", "", "no queryer set", std::nullopt,
                 ErrorCategory::NoQueryerConfigured};
}

} // anonymous namespace

Result<std::unique_ptr<ComponentCache>, Error> ComponentCache::Create(
    std::shared_ptr<IDashConfig> dash_config,
    std::size_t capacity) {
    if (!dash_config) {
        return Result<std::unique_ptr<ComponentCache>, Error>::Err(Error{
            "ComponentCache::Create", "", "dash config is null", std::nullopt,
            ErrorCategory::Configuration});
    }
    auto components = LruCache<ObjectKey, ComponentPtr>::Create(capacity);
    if (components.IsErr()) {
        return Result<std::unique_ptr<ComponentCache>, Error>::Err(
            std::move(components).Error());
    }
    auto cache = std::make_unique<ComponentCache>(PrivateTag{}, std::move(dash_config),
                                                  std::move(components).Value());
    return Result<std::unique_ptr<ComponentCache>, Error>::Ok(std::move(cache));
}

ComponentCache::ComponentCache(PrivateTag,
                               std::shared_ptr<IDashConfig> dash_config,
                               LruCache<ObjectKey, ComponentPtr> components)
    : dash_config_(std::move(dash_config)),
      components_(std::move(components)) {}

ComponentCache::~ComponentCache() {
    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        worker.cancel();
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void ComponentCache::SetQueryer(std::shared_ptr<IQueryer> queryer) {
    std::lock_guard<std::mutex> lock(mutex_);
    queryer_ = std::move(queryer);
}

Result<ComponentPtr, Error> ComponentCache::Get(const Context& ctx, const Object& object) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!queryer_) {
            return Result<ComponentPtr, Error>::Err(MakeNoQueryerError());
        }
    }

    auto key_result = KeyFromObject(object);
    if (key_result.IsErr()) {
        return Result<ComponentPtr, Error>::Err(std::move(key_result).Error());
    }
    const auto& key = key_result.Value();

    std::shared_ptr<Promise> promise;
    std::uint64_t flight_id = 0;
    std::optional<ComponentPtr> retained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto hit = components_.Get(key)) {
            if (failed_.count(key) == 0 || in_flight_.count(key) != 0) {
                LogDebug(kLogComponent, "hit " + key.ToString());
                return Result<ComponentPtr, Error>::Ok(std::move(*hit));
            }
            // Last resolution failed: serve the placeholder and try again.
            retained = std::move(*hit);
            failed_.erase(key);
        }
        if (in_flight_.count(key) == 0) {
            promise = std::make_shared<Promise>();
            flight_id = RegisterLocked(key, promise->get_future().share());
        }
    }

    auto viewer = NewResourceViewer(ctx);
    if (viewer.IsErr()) {
        if (promise) {
            Fail(key, viewer.Error(), *promise, flight_id);
        }
        if (retained.has_value()) {
            return Result<ComponentPtr, Error>::Ok(std::move(*retained));
        }
        return Result<ComponentPtr, Error>::Err(std::move(viewer).Error());
    }

    auto component = GetComponent(ctx, key, object, *viewer.Value());
    if (component.IsErr()) {
        if (promise) {
            Fail(key, component.Error(), *promise, flight_id);
        }
        if (retained.has_value()) {
            return Result<ComponentPtr, Error>::Ok(std::move(*retained));
        }
        return component;
    }

    if (!promise) {
        LogDebug(kLogComponent, "resolution of " + key.ToString() + " already in flight");
        return component;
    }

    if (retained.has_value()) {
        LogDebug(kLogComponent, "retrying resolution of " + key.ToString());
        Launch(ctx, key, object, std::move(viewer).Value(), std::move(promise), flight_id);
        return Result<ComponentPtr, Error>::Ok(std::move(*retained));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        PutLocked(key, component.Value());
    }
    LogDebug(kLogComponent, "miss " + key.ToString() + ", resolving in background");
    Launch(ctx, key, object, std::move(viewer).Value(), std::move(promise), flight_id);
    return component;
}

std::optional<ComponentPtr> ComponentCache::Find(const ObjectKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return components_.Get(key);
}

std::optional<Completion> ComponentCache::Pending(const ObjectKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = in_flight_.find(key);
    if (it == in_flight_.end()) {
        return std::nullopt;
    }
    return it->second.completion;
}

std::size_t ComponentCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return components_.Size();
}

std::size_t ComponentCache::Capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return components_.Capacity();
}

Result<std::shared_ptr<ResourceViewer>, Error> ComponentCache::NewResourceViewer(
    const Context& ctx) {
    auto live = ctx.Check("ComponentCache::NewResourceViewer");
    if (live.IsErr()) {
        return Result<std::shared_ptr<ResourceViewer>, Error>::Err(std::move(live).Error());
    }

    std::shared_ptr<IQueryer> queryer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queryer = queryer_;
    }
    if (!queryer) {
        return Result<std::shared_ptr<ResourceViewer>, Error>::Err(MakeNoQueryerError());
    }

    auto viewer = ResourceViewer::Create(*dash_config_, {WithDefaultQueryer(queryer)});
    if (viewer.IsErr()) {
        return Result<std::shared_ptr<ResourceViewer>, Error>::Err(std::move(viewer).Error());
    }
    return Result<std::shared_ptr<ResourceViewer>, Error>::Ok(
        std::shared_ptr<ResourceViewer>(std::move(viewer).Value()));
}

Result<ComponentPtr, Error> ComponentCache::GetComponent(
    const Context& ctx,
    const ObjectKey& key,
    const Object& object,
    ResourceViewer& viewer) {
    auto live = ctx.Check("ComponentCache::GetComponent");
    if (live.IsErr()) {
        return Result<ComponentPtr, Error>::Err(std::move(live).Error());
    }
    auto component = viewer.Component(object);
    if (component.IsOk()) {
        LogDebug(kLogComponent, "graph for " + key.ToString() + " has " +
                                    std::to_string(component.Value()->Nodes().size()) +
                                    " nodes");
    }
    return component;
}

Completion ComponentCache::Visit(const Context& ctx,
                                 const ObjectKey& key,
                                 const Object& object,
                                 std::shared_ptr<ResourceViewer> viewer) {
    auto promise = std::make_shared<Promise>();
    Completion completion = promise->get_future().share();
    std::uint64_t flight_id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        flight_id = RegisterLocked(key, completion);
    }
    Launch(ctx, key, object, std::move(viewer), std::move(promise), flight_id);
    return completion;
}

std::uint64_t ComponentCache::RegisterLocked(const ObjectKey& key,
                                             const Completion& completion) {
    const auto id = next_flight_id_++;
    in_flight_[key] = InFlight{id, completion};
    return id;
}

void ComponentCache::Launch(const Context& ctx,
                            const ObjectKey& key,
                            const Object& object,
                            std::shared_ptr<ResourceViewer> viewer,
                            std::shared_ptr<Promise> promise,
                            std::uint64_t flight_id) {
    ReapFinishedWorkers();

    auto child = Context::WithCancel(ctx);
    Context task_ctx = child.first;
    auto finished = std::make_shared<std::atomic<bool>>(false);

    std::thread thread([this, task_ctx, key, object, viewer = std::move(viewer),
                        promise = std::move(promise), flight_id, finished]() {
        try {
            Resolve(task_ctx, key, object, viewer, *promise, flight_id);
        } catch (const std::exception& e) {
            Fail(key,
                 Error{"ComponentCache::Visit", key.ToString(),
                       std::string("resolution threw: ") + e.what(), std::nullopt,
                       ErrorCategory::Internal},
                 *promise, flight_id);
        }
        finished->store(true);
    });

    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.push_back(Worker{std::move(thread), std::move(child.second), std::move(finished)});
}

void ComponentCache::Resolve(const Context& ctx,
                             const ObjectKey& key,
                             const Object& object,
                             const std::shared_ptr<ResourceViewer>& viewer,
                             Promise& promise,
                             std::uint64_t flight_id) {
    auto path = dash_config_->ObjectPath(ctx, object.api_version, object.kind, object.name);
    if (path.IsErr()) {
        if (path.Error().Is(ErrorCategory::ContextCancelled)) {
            Fail(key, std::move(path).Error(), promise, flight_id);
            return;
        }
        Fail(key,
             Error::Wrap(ErrorCategory::PathResolution, "ComponentCache::Visit",
                         key.ToString(), "unable to resolve object path", path.Error()),
             promise, flight_id);
        return;
    }
    viewer->SetRootPath(path.Value());

    auto component = viewer->Visit(ctx, object);
    if (component.IsErr()) {
        Fail(key, std::move(component).Error(), promise, flight_id);
        return;
    }

    // A cancelled resolution never installs its graph.
    auto live = ctx.Check("ComponentCache::Visit");
    if (live.IsErr()) {
        Fail(key, std::move(live).Error(), promise, flight_id);
        return;
    }

    auto resolved = KeyFromObject(object);
    if (resolved.IsErr()) {
        Fail(key, std::move(resolved).Error(), promise, flight_id);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        PutLocked(resolved.Value(), component.Value());
        failed_.erase(key);
        ForgetLocked(key, flight_id);
    }
    LogDebug(kLogComponent, "resolved " + key.ToString() + " with " +
                                std::to_string(component.Value()->Nodes().size()) +
                                " nodes");
    promise.set_value(std::move(resolved));
}

void ComponentCache::Fail(const ObjectKey& key, Error error, Promise& promise,
                          std::uint64_t flight_id) {
    LogWarn(kLogComponent, "resolution of " + key.ToString() + " failed: " +
                               error.ToString());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ForgetLocked(key, flight_id);
        if (components_.Contains(key)) {
            failed_.insert(key);
        }
    }
    promise.set_value(Result<ObjectKey, Error>::Err(std::move(error)));
}

void ComponentCache::ForgetLocked(const ObjectKey& key, std::uint64_t flight_id) {
    auto it = in_flight_.find(key);
    if (it != in_flight_.end() && it->second.id == flight_id) {
        in_flight_.erase(it);
    }
}

void ComponentCache::PutLocked(const ObjectKey& key, ComponentPtr component) {
    auto evicted = components_.Put(key, std::move(component));
    if (evicted.has_value()) {
        failed_.erase(*evicted);
        LogDebug(kLogComponent, "evicted " + evicted->ToString());
    }
}

void ComponentCache::ReapFinishedWorkers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->finished->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace dashgraph
