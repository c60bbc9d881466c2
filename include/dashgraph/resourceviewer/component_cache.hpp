#pragma once

#include <dashgraph/component/resource_viewer_component.hpp>
#include <dashgraph/core/context.hpp>
#include <dashgraph/core/lru_cache.hpp>
#include <dashgraph/core/result.hpp>
#include <dashgraph/dash/i_dash_config.hpp>
#include <dashgraph/object/i_queryer.hpp>
#include <dashgraph/object/object.hpp>
#include <dashgraph/object/object_key.hpp>
#include <dashgraph/resourceviewer/resource_viewer.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace dashgraph {

inline constexpr std::size_t kDefaultComponentCacheCapacity = 100;

/// Fulfilled once by a background resolution: the resolved key, or why the
/// resolution failed.
using Completion = std::shared_future<Result<ObjectKey, Error>>;

// ---------------------------------------------------------------------------
// ComponentCache — LRU of rendered resource graphs keyed by object identity.
//
// Get() answers from the cache when it can. On a miss it stores a
// placeholder graph (root under kPlaceholderNodeId) right away and resolves
// the full graph on a background thread; the resolved graph replaces the
// placeholder under the same key. Lookups never wait for a resolution.
//
// Concurrent misses for one key share a single traversal. A key whose last
// resolution failed keeps its placeholder, and the next Get for it starts a
// new resolution. Destroying the cache cancels in-flight resolutions and
// joins their threads.
// ---------------------------------------------------------------------------
class ComponentCache {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// Fails with Configuration on a null dash configuration or zero capacity.
    static Result<std::unique_ptr<ComponentCache>, Error> Create(
        std::shared_ptr<IDashConfig> dash_config,
        std::size_t capacity = kDefaultComponentCacheCapacity);

    ComponentCache(PrivateTag,
                   std::shared_ptr<IDashConfig> dash_config,
                   LruCache<ObjectKey, ComponentPtr> components);
    ~ComponentCache();

    ComponentCache(const ComponentCache&) = delete;
    ComponentCache& operator=(const ComponentCache&) = delete;
    ComponentCache(ComponentCache&&) = delete;
    ComponentCache& operator=(ComponentCache&&) = delete;

    /// Set (or clear, with nullptr) the queryer used for new traversals.
    void SetQueryer(std::shared_ptr<IQueryer> queryer);

    /// Graph for `object`. NoQueryerConfigured until SetQueryer was called.
    [[nodiscard]] Result<ComponentPtr, Error> Get(const Context& ctx, const Object& object);

    /// Cached component for `key`, if any. Counts as a use.
    [[nodiscard]] std::optional<ComponentPtr> Find(const ObjectKey& key);

    /// Completion of the in-flight resolution for `key`, if any.
    [[nodiscard]] std::optional<Completion> Pending(const ObjectKey& key) const;

    [[nodiscard]] std::size_t Size() const;
    [[nodiscard]] std::size_t Capacity() const;

    // -- Building blocks of Get ---------------------------------------------

    /// Viewer wired with the current queryer.
    [[nodiscard]] Result<std::shared_ptr<ResourceViewer>, Error> NewResourceViewer(
        const Context& ctx);

    /// Current graph of `viewer` for `object`; before Visit completes the
    /// root sits under the placeholder id.
    [[nodiscard]] Result<ComponentPtr, Error> GetComponent(
        const Context& ctx,
        const ObjectKey& key,
        const Object& object,
        ResourceViewer& viewer);

    /// Resolve the full graph for `object` in the background. On success
    /// the resolved component is cached under the resolved key.
    [[nodiscard]] Completion Visit(const Context& ctx,
                                   const ObjectKey& key,
                                   const Object& object,
                                   std::shared_ptr<ResourceViewer> viewer);

private:
    using Promise = std::promise<Result<ObjectKey, Error>>;

    struct InFlight {
        std::uint64_t id = 0;
        Completion completion;
    };

    struct Worker {
        std::thread thread;
        CancelFunc cancel;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    // Registers an in-flight entry for `key` (caller holds mutex_).
    std::uint64_t RegisterLocked(const ObjectKey& key, const Completion& completion);

    void Launch(const Context& ctx,
                const ObjectKey& key,
                const Object& object,
                std::shared_ptr<ResourceViewer> viewer,
                std::shared_ptr<Promise> promise,
                std::uint64_t flight_id);

    void Resolve(const Context& ctx,
                 const ObjectKey& key,
                 const Object& object,
                 const std::shared_ptr<ResourceViewer>& viewer,
                 Promise& promise,
                 std::uint64_t flight_id);

    void Fail(const ObjectKey& key, Error error, Promise& promise, std::uint64_t flight_id);

    void ForgetLocked(const ObjectKey& key, std::uint64_t flight_id);

    // Caches `component` under `key` (caller holds mutex_).
    void PutLocked(const ObjectKey& key, ComponentPtr component);

    void ReapFinishedWorkers();

    std::shared_ptr<IDashConfig> dash_config_;

    mutable std::mutex mutex_;
    LruCache<ObjectKey, ComponentPtr> components_;
    std::unordered_map<ObjectKey, InFlight> in_flight_;
    std::unordered_set<ObjectKey> failed_;
    std::shared_ptr<IQueryer> queryer_;
    std::uint64_t next_flight_id_ = 1;

    std::mutex workers_mutex_;
    std::list<Worker> workers_;
};

} // namespace dashgraph
