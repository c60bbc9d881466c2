#include <catch2/catch_test_macros.hpp>

#include <dashgraph/resourceviewer/resource_viewer.hpp>

#include "mocks/mock_dash_config.hpp"
#include "mocks/mock_object_store.hpp"
#include "mocks/mock_queryer.hpp"
#include "mocks/object_fixtures.hpp"

#include <memory>
#include <string>
#include <utility>

using namespace dashgraph;
using namespace dashgraph::testing;

namespace {

class StubVisitor : public IVisitor {
public:
    explicit StubVisitor(Result<void, Error> result) : result_(std::move(result)) {}

    Result<void, Error> Visit(const Context&, const Object&) override {
        ++calls;
        return result_;
    }

    int calls = 0;

private:
    Result<void, Error> result_;
};

struct Fixture {
    std::shared_ptr<MockObjectStore> store = std::make_shared<MockObjectStore>();
    std::shared_ptr<MockDashConfig> dash = std::make_shared<MockDashConfig>(store);
    std::shared_ptr<MockQueryer> queryer = std::make_shared<MockQueryer>();

    std::unique_ptr<ResourceViewer> MakeViewer() {
        auto rv = ResourceViewer::Create(*dash, {WithDefaultQueryer(queryer)});
        REQUIRE(rv.IsOk());
        return std::move(rv).Value();
    }
};

} // anonymous namespace

// ===========================================================================
// Create
// ===========================================================================

TEST_CASE("ResourceViewer: requires an object store", "[viewer][config]") {
    MockDashConfig dash(nullptr);
    auto queryer = std::make_shared<MockQueryer>();
    auto rv = ResourceViewer::Create(dash, {WithDefaultQueryer(queryer)});
    REQUIRE(rv.IsErr());
    CHECK(rv.Error().Is(ErrorCategory::Configuration));
}

TEST_CASE("ResourceViewer: requires a visitor", "[viewer][config]") {
    Fixture f;
    auto rv = ResourceViewer::Create(*f.dash);
    REQUIRE(rv.IsErr());
    CHECK(rv.Error().Is(ErrorCategory::Configuration));
    CHECK(rv.Error().message == "no visitor configured");
}

TEST_CASE("ResourceViewer: options reject null collaborators", "[viewer][config]") {
    Fixture f;
    auto no_visitor = ResourceViewer::Create(*f.dash, {WithVisitor(nullptr)});
    REQUIRE(no_visitor.IsErr());
    CHECK(no_visitor.Error().Is(ErrorCategory::Configuration));

    auto no_queryer = ResourceViewer::Create(*f.dash, {WithDefaultQueryer(nullptr)});
    REQUIRE(no_queryer.IsErr());
    CHECK(no_queryer.Error().Is(ErrorCategory::Configuration));
}

TEST_CASE("ResourceViewer: SetVisitor rejects null", "[viewer][config]") {
    Fixture f;
    auto rv = f.MakeViewer();
    auto set = rv->SetVisitor(nullptr);
    REQUIRE(set.IsErr());
    CHECK(set.Error().Is(ErrorCategory::Configuration));

    // The previously configured visitor is still in place.
    f.queryer->SetChildren(Deployment(), {ReplicaSet()});
    auto component = rv->Visit(Context::Background(), Deployment());
    REQUIRE(component.IsOk());
    CHECK(component.Value()->Nodes().size() == 2);
}

// ===========================================================================
// Component (no traversal)
// ===========================================================================

TEST_CASE("ResourceViewer: Component returns the placeholder root", "[viewer]") {
    Fixture f;
    f.queryer->SetChildren(Deployment(), {ReplicaSet()});
    auto rv = f.MakeViewer();

    auto component = rv->Component(Deployment());
    REQUIRE(component.IsOk());
    const auto& c = *component.Value();

    CHECK(c.Selected() == kPlaceholderNodeId);
    REQUIRE(c.Nodes().size() == 1);
    const auto* root = c.FindNode(kPlaceholderNodeId);
    REQUIRE(root != nullptr);
    CHECK(root->name == "deployment");
    CHECK(root->kind == "Deployment");
    CHECK(rv->RootStatus() == RootState::Pending);
    CHECK(f.queryer->CallCount() == 0);
}

TEST_CASE("ResourceViewer: Component rejects an invalid object", "[viewer]") {
    Fixture f;
    auto rv = f.MakeViewer();
    auto component = rv->Component(MakeObject("v1", "Pod", ""));
    REQUIRE(component.IsErr());
    CHECK(component.Error().Is(ErrorCategory::InvalidObject));
}

// ===========================================================================
// Visit
// ===========================================================================

TEST_CASE("ResourceViewer: Visit resolves the root and collects children", "[viewer]") {
    Fixture f;
    f.queryer->SetChildren(Deployment(), {ReplicaSet()});
    f.queryer->SetChildren(ReplicaSet(), {Pod("pod-a")});
    auto rv = f.MakeViewer();
    rv->SetRootPath("/overview/deployments/deployment");

    auto component = rv->Visit(Context::Background(), Deployment());
    REQUIRE(component.IsOk());
    const auto& c = *component.Value();

    CHECK(rv->RootStatus() == RootState::Resolved);
    CHECK(c.Selected() == "deployment");
    CHECK(c.FindNode(kPlaceholderNodeId) == nullptr);
    REQUIRE(c.Nodes().size() == 3);

    const auto* root = c.FindNode("deployment");
    REQUIRE(root != nullptr);
    CHECK(root->path == "/overview/deployments/deployment");
    REQUIRE(root->edges.size() == 1);
    CHECK(root->edges[0].node == "replica-set");

    const auto* rs = c.FindNode("replica-set");
    REQUIRE(rs != nullptr);
    REQUIRE(rs->edges.size() == 1);
    CHECK(rs->edges[0].node == "pod-a");
    CHECK(f.store->GetCount() == 1);
}

TEST_CASE("ResourceViewer: stored copy of the root is walked", "[viewer]") {
    Fixture f;
    auto stored = Deployment();
    stored.labels["app"] = "web";
    f.store->Put(stored);
    f.queryer->SetChildren(Deployment(), {ReplicaSet()});
    auto rv = f.MakeViewer();

    auto component = rv->Visit(Context::Background(), Deployment());
    REQUIRE(component.IsOk());
    REQUIRE(component.Value()->Nodes().size() == 2);
    const auto* root = component.Value()->FindNode("deployment");
    REQUIRE(root != nullptr);
    CHECK(root->edges.size() == 1);
}

TEST_CASE("ResourceViewer: stored root with another uid does not duplicate the root",
          "[viewer]") {
    Fixture f;
    const auto given = MakeObject("apps/v1", "Deployment", "deployment");
    f.store->Put(MakeObject("apps/v1", "Deployment", "deployment", "dep-uid"));
    f.queryer->SetChildren(given, {ReplicaSet()});
    auto rv = f.MakeViewer();

    auto component = rv->Visit(Context::Background(), given);
    REQUIRE(component.IsOk());
    const auto& c = *component.Value();
    const std::string root_id = "obj:apps/v1:Deployment:default:deployment";

    CHECK(c.Selected() == root_id);
    REQUIRE(c.Nodes().size() == 2);
    CHECK(c.FindNode("dep-uid") == nullptr);
    CHECK(c.FindNode(kPlaceholderNodeId) == nullptr);

    const auto* root = c.FindNode(root_id);
    REQUIRE(root != nullptr);
    CHECK(root->name == "deployment");
    REQUIRE(root->edges.size() == 1);
    CHECK(root->edges[0].node == "replica-set");
    CHECK(c.FindNode("replica-set") != nullptr);
}

TEST_CASE("ResourceViewer: snapshots do not change after a later Visit", "[viewer]") {
    Fixture f;
    f.queryer->SetChildren(Deployment(), {ReplicaSet()});
    auto rv = f.MakeViewer();

    auto before = rv->Component(Deployment());
    REQUIRE(before.IsOk());
    REQUIRE(rv->Visit(Context::Background(), Deployment()).IsOk());

    CHECK(before.Value()->Selected() == kPlaceholderNodeId);
    CHECK(before.Value()->Nodes().size() == 1);
}

TEST_CASE("ResourceViewer: object store failure does not fail the visit", "[viewer]") {
    Fixture f;
    f.store->SetError(Error{"Get", "", "store offline", std::nullopt,
                            ErrorCategory::Internal});
    auto rv = f.MakeViewer();

    auto component = rv->Visit(Context::Background(), Deployment());
    REQUIRE(component.IsOk());
    CHECK(component.Value()->Selected() == "deployment");
}

TEST_CASE("ResourceViewer: visitor failure keeps the root pending", "[viewer][error]") {
    Fixture f;
    auto visitor = std::make_shared<StubVisitor>(Result<void, Error>::Err(
        Error{"Visit", "", "exploded", std::nullopt, ErrorCategory::ChildLookup}));
    auto rv = ResourceViewer::Create(*f.dash, {WithVisitor(visitor)});
    REQUIRE(rv.IsOk());

    auto component = rv.Value()->Visit(Context::Background(), Deployment());
    REQUIRE(component.IsErr());
    CHECK(component.Error().Is(ErrorCategory::ChildLookup));
    CHECK(visitor->calls == 1);
    CHECK(rv.Value()->RootStatus() == RootState::Pending);
}

TEST_CASE("ResourceViewer: custom visitor sees the root once", "[viewer]") {
    Fixture f;
    auto visitor = std::make_shared<StubVisitor>(Result<void, Error>::Ok());
    auto rv = ResourceViewer::Create(*f.dash, {WithVisitor(visitor)});
    REQUIRE(rv.IsOk());

    auto component = rv.Value()->Visit(Context::Background(), Deployment());
    REQUIRE(component.IsOk());
    CHECK(visitor->calls == 1);
    CHECK(component.Value()->Nodes().size() == 1);
    CHECK(component.Value()->FindNode("deployment") != nullptr);
}

TEST_CASE("ResourceViewer: cancelled visit returns the cancellation", "[viewer][cancel]") {
    Fixture f;
    auto rv = f.MakeViewer();
    auto [ctx, cancel] = Context::WithCancel(Context::Background());
    cancel();

    auto component = rv->Visit(ctx, Deployment());
    REQUIRE(component.IsErr());
    CHECK(component.Error().Is(ErrorCategory::ContextCancelled));
    CHECK(rv->RootStatus() == RootState::Pending);
}
