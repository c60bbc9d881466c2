#pragma once

#include <dashgraph/object/i_queryer.hpp>
#include <dashgraph/object/object_key.hpp>

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace dashgraph {
namespace testing {

// ---------------------------------------------------------------------------
// MockQueryer — hand-written queryer for offline graph tests.
//
// Usage:
//   MockQueryer queryer;
//   queryer.SetChildren(deployment, {replica_set});
//   queryer.SetError(replica_set, Error{...});
//   auto result = queryer.Children(ctx, deployment);
//   CHECK(queryer.CallCount() == 1);
//   CHECK(queryer.Calls()[0] == "deployment");
//
// Children are registered per parent node id. Parents without an entry have
// no children. Hold() makes every call wait until Release() or until the
// caller's context is done. Safe to call from several threads.
// ---------------------------------------------------------------------------

class MockQueryer : public IQueryer {
public:
    MockQueryer() = default;

    // -- Configure responses ------------------------------------------------

    void SetChildren(const Object& parent, std::vector<Object> children) {
        std::lock_guard<std::mutex> lock(mutex_);
        children_[IdOf(parent)] = std::move(children);
    }

    void SetError(const Object& parent, Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        errors_[IdOf(parent)] = std::move(error);
    }

    void Hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
    }

    void Release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = false;
        }
        cv_.notify_all();
    }

    // -- IQueryer -----------------------------------------------------------

    Result<std::vector<Object>, Error> Children(const Context& ctx,
                                                const Object& object) override {
        const auto id = IdOf(object);
        std::unique_lock<std::mutex> lock(mutex_);
        calls_.push_back(id);
        cv_.notify_all();

        while (held_ && !ctx.Done()) {
            cv_.wait_for(lock, std::chrono::milliseconds(5));
        }
        auto live = ctx.Check("MockQueryer::Children");
        if (live.IsErr()) {
            return Result<std::vector<Object>, Error>::Err(std::move(live).Error());
        }

        auto err = errors_.find(id);
        if (err != errors_.end()) {
            return Result<std::vector<Object>, Error>::Err(err->second);
        }
        auto it = children_.find(id);
        if (it == children_.end()) {
            return Result<std::vector<Object>, Error>::Ok({});
        }
        return Result<std::vector<Object>, Error>::Ok(it->second);
    }

    // -- Inspect calls ------------------------------------------------------

    std::vector<std::string> Calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    size_t CallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    /// Block until at least `count` calls were made or `timeout` passed.
    bool WaitForCalls(size_t count, std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return calls_.size() >= count; });
    }

private:
    static std::string IdOf(const Object& object) {
        auto key = KeyFromObject(object);
        return key.IsOk() ? key.Value().NodeId() : object.name;
    }

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::map<std::string, std::vector<Object>> children_;
    std::map<std::string, Error> errors_;
    std::vector<std::string> calls_;
    bool held_ = false;
};

} // namespace testing
} // namespace dashgraph
