#include <dashgraph/objectvisitor/visitor.hpp>

#include <dashgraph/core/log.hpp>
#include <dashgraph/object/object_key.hpp>

#include <optional>
#include <utility>

namespace dashgraph {

namespace {

constexpr const char* kLogComponent = "visitor";

} // anonymous namespace

DefaultVisitor::DefaultVisitor(std::shared_ptr<IQueryer> queryer, IObjectHandler& handler)
    : queryer_(std::move(queryer)), handler_(handler) {}

Result<void, Error> DefaultVisitor::Visit(const Context& ctx, const Object& object) {
    std::set<std::string> visited;
    return VisitObject(ctx, object, visited);
}

Result<void, Error> DefaultVisitor::VisitObject(const Context& ctx, const Object& object,
                                                std::set<std::string>& visited) {
    auto key = KeyFromObject(object);
    if (key.IsErr()) {
        return Result<void, Error>::Err(std::move(key).Error());
    }
    const auto& object_key = key.Value();

    if (!visited.insert(object_key.NodeId()).second) {
        return Result<void, Error>::Ok();
    }

    auto processed = handler_.Process(ctx, object);
    if (processed.IsErr()) {
        return processed;
    }

    auto live = ctx.Check("Visit");
    if (live.IsErr()) {
        return live;
    }

    auto children = queryer_->Children(ctx, object);
    if (children.IsErr()) {
        if (children.Error().Is(ErrorCategory::ContextCancelled)) {
            return Result<void, Error>::Err(std::move(children).Error());
        }
        auto err = Error::Wrap(ErrorCategory::ChildLookup, "Visit", object_key.ToString(),
                               "unable to fetch children", children.Error());
        LogWarn(kLogComponent, err.ToString());
        return Result<void, Error>::Err(std::move(err));
    }

    LogDebug(kLogComponent, object_key.ToString() + " has " +
                                std::to_string(children.Value().size()) + " children");

    std::optional<Error> first_error;
    for (const auto& child : children.Value()) {
        auto added = handler_.AddChild(object, child);
        if (added.IsErr()) {
            if (!first_error.has_value()) {
                first_error = std::move(added).Error();
            }
            continue;
        }

        auto result = VisitObject(ctx, child, visited);
        if (result.IsErr()) {
            if (result.Error().Is(ErrorCategory::ContextCancelled)) {
                return result;
            }
            if (!first_error.has_value()) {
                first_error = std::move(result).Error();
            }
        }
    }

    if (first_error.has_value()) {
        return Result<void, Error>::Err(std::move(*first_error));
    }
    return Result<void, Error>::Ok();
}

} // namespace dashgraph
