#include <dashgraph/core/context.hpp>

#include <string>

namespace dashgraph {

Context Context::Background() {
    return Context(std::make_shared<State>());
}

std::pair<Context, CancelFunc> Context::WithCancel(const Context& parent) {
    auto state = std::make_shared<State>();
    state->parent = parent.state_;
    std::weak_ptr<State> weak = state;
    CancelFunc cancel = [weak]() {
        if (auto s = weak.lock()) {
            s->cancelled.store(true);
        }
    };
    return {Context(std::move(state)), std::move(cancel)};
}

std::pair<Context, CancelFunc> Context::WithTimeout(const Context& parent,
                                                    std::chrono::milliseconds timeout) {
    auto [ctx, cancel] = WithCancel(parent);
    ctx.state_->deadline = Clock::now() + timeout;
    return {std::move(ctx), std::move(cancel)};
}

bool Context::Cancelled(const State& state) {
    for (const State* s = &state; s != nullptr; s = s->parent.get()) {
        if (s->cancelled.load()) {
            return true;
        }
    }
    return false;
}

bool Context::Expired(const State& state, Clock::time_point now) {
    for (const State* s = &state; s != nullptr; s = s->parent.get()) {
        if (s->deadline.has_value() && now >= *s->deadline) {
            return true;
        }
    }
    return false;
}

bool Context::Done() const {
    return Cancelled(*state_) || Expired(*state_, Clock::now());
}

std::optional<Context::Clock::time_point> Context::Deadline() const {
    std::optional<Clock::time_point> earliest;
    for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->deadline.has_value() &&
            (!earliest.has_value() || *s->deadline < *earliest)) {
            earliest = s->deadline;
        }
    }
    return earliest;
}

Result<void, Error> Context::Check(std::string_view operation) const {
    if (Cancelled(*state_)) {
        return Result<void, Error>::Err(Error{
            std::string(operation), "", "context canceled", std::nullopt,
            ErrorCategory::ContextCancelled});
    }
    if (Expired(*state_, Clock::now())) {
        return Result<void, Error>::Err(Error{
            std::string(operation), "", "context deadline exceeded", std::nullopt,
            ErrorCategory::ContextCancelled});
    }
    return Result<void, Error>::Ok();
}

} // namespace dashgraph
