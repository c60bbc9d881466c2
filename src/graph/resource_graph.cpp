#include <dashgraph/graph/resource_graph.hpp>

#include <algorithm>
#include <utility>

namespace dashgraph {

namespace {

void ApplyIdentity(Node& node, const Object& object) {
    node.name = object.name;
    node.api_version = object.api_version;
    node.kind = object.kind;
    node.namespace_name = object.namespace_name;
}

bool AppendEdge(Node& node, Edge edge) {
    if (std::find(node.edges.begin(), node.edges.end(), edge) != node.edges.end()) {
        return false;
    }
    node.edges.push_back(std::move(edge));
    return true;
}

} // anonymous namespace

const char* EdgeTypeName(EdgeType type) {
    switch (type) {
        case EdgeType::Explicit: return "explicit";
        case EdgeType::Implicit: return "implicit";
    }
    return "explicit";
}

bool ResourceGraph::SetPendingRoot(const Object& root, const ObjectKey& key) {
    if (has_root_) {
        return false;
    }
    Node node;
    ApplyIdentity(node, root);
    nodes_[kPlaceholderNodeId] = std::move(node);
    has_root_ = true;
    state_ = RootState::Pending;
    root_id_ = key.NodeId();
    return true;
}

std::string ResourceGraph::RootNodeId() const {
    if (!has_root_) {
        return "";
    }
    return state_ == RootState::Pending ? std::string(kPlaceholderNodeId) : root_id_;
}

std::string ResourceGraph::NodeIdFor(const ObjectKey& key) const {
    auto id = key.NodeId();
    if (has_root_ && state_ == RootState::Pending && id == root_id_) {
        return kPlaceholderNodeId;
    }
    return id;
}

bool ResourceGraph::AddNode(const Object& object, const ObjectKey& key) {
    const auto id = NodeIdFor(key);
    auto it = nodes_.find(id);
    if (it != nodes_.end()) {
        ApplyIdentity(it->second, object);
        return false;
    }
    Node node;
    ApplyIdentity(node, object);
    nodes_.emplace(id, std::move(node));
    return true;
}

bool ResourceGraph::AddEdge(const ObjectKey& from, const ObjectKey& to, EdgeType type) {
    auto it = nodes_.find(NodeIdFor(from));
    if (it == nodes_.end()) {
        return false;
    }
    return AppendEdge(it->second, Edge{NodeIdFor(to), type});
}

void ResourceGraph::SetRootPath(std::string path) {
    auto it = nodes_.find(RootNodeId());
    if (it != nodes_.end()) {
        it->second.path = std::move(path);
    }
}

Result<void, Error> ResourceGraph::ResolveRoot() {
    if (!has_root_) {
        return Result<void, Error>::Err(Error{
            "ResolveRoot", "", "graph has no root node", std::nullopt,
            ErrorCategory::Internal});
    }
    if (state_ == RootState::Resolved) {
        return Result<void, Error>::Ok();
    }

    auto placeholder = nodes_.find(kPlaceholderNodeId);
    Node root = std::move(placeholder->second);
    nodes_.erase(placeholder);

    auto existing = nodes_.find(root_id_);
    if (existing == nodes_.end()) {
        nodes_.emplace(root_id_, std::move(root));
    } else {
        for (auto& edge : root.edges) {
            AppendEdge(existing->second, std::move(edge));
        }
        if (existing->second.path.empty()) {
            existing->second.path = std::move(root.path);
        }
    }

    for (auto& [id, node] : nodes_) {
        std::vector<Edge> rewritten;
        rewritten.reserve(node.edges.size());
        for (auto& edge : node.edges) {
            if (edge.node == kPlaceholderNodeId) {
                edge.node = root_id_;
            }
            if (std::find(rewritten.begin(), rewritten.end(), edge) == rewritten.end()) {
                rewritten.push_back(std::move(edge));
            }
        }
        node.edges = std::move(rewritten);
    }

    state_ = RootState::Resolved;
    return Result<void, Error>::Ok();
}

} // namespace dashgraph
