#pragma once

#include <dashgraph/core/result.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

namespace dashgraph {

using CancelFunc = std::function<void()>;

// ---------------------------------------------------------------------------
// Context — cancellation and deadline signal threaded through every
// collaborator call.
//
// Contexts form a chain: a child is done when it was cancelled, its deadline
// passed, or any ancestor is done. Copies share state, so cancelling through
// the CancelFunc is visible to every copy. Safe to query from any thread.
// ---------------------------------------------------------------------------
class Context {
public:
    using Clock = std::chrono::steady_clock;

    /// Root context: never cancelled, no deadline.
    static Context Background();

    /// Child context plus the function that cancels it (idempotent).
    static std::pair<Context, CancelFunc> WithCancel(const Context& parent);

    /// Child context that is done once `timeout` elapses (or when cancelled).
    static std::pair<Context, CancelFunc> WithTimeout(const Context& parent,
                                                      std::chrono::milliseconds timeout);

    [[nodiscard]] bool Done() const;

    /// Earliest deadline along the chain, if any.
    [[nodiscard]] std::optional<Clock::time_point> Deadline() const;

    /// Ok while the context is live; ContextCancelled error once it is done.
    [[nodiscard]] Result<void, Error> Check(std::string_view operation) const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::optional<Clock::time_point> deadline;
        std::shared_ptr<const State> parent;
    };

    explicit Context(std::shared_ptr<State> state) : state_(std::move(state)) {}

    static bool Cancelled(const State& state);
    static bool Expired(const State& state, Clock::time_point now);

    std::shared_ptr<State> state_;
};

} // namespace dashgraph
