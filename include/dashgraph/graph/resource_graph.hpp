#pragma once

#include <dashgraph/core/result.hpp>
#include <dashgraph/object/object.hpp>
#include <dashgraph/object/object_key.hpp>

#include <map>
#include <string>
#include <vector>

namespace dashgraph {

/// Node id of a root whose identity is not resolved yet.
inline constexpr const char* kPlaceholderNodeId = "emptyID";

enum class EdgeType {
    Explicit,  // owner/child relationship reported by the queryer
    Implicit,
};

[[nodiscard]] const char* EdgeTypeName(EdgeType type);

struct Edge {
    std::string node;  // target node id
    EdgeType type = EdgeType::Explicit;

    bool operator==(const Edge& other) const {
        return node == other.node && type == other.type;
    }
    bool operator!=(const Edge& other) const { return !(*this == other); }
};

struct Node {
    std::string name;
    std::string api_version;
    std::string kind;
    std::string namespace_name;
    std::string path;
    std::vector<Edge> edges;  // outgoing, in discovery order

    bool operator==(const Node& other) const {
        return name == other.name && api_version == other.api_version &&
               kind == other.kind && namespace_name == other.namespace_name &&
               path == other.path && edges == other.edges;
    }
    bool operator!=(const Node& other) const { return !(*this == other); }
};

using NodeMap = std::map<std::string, Node>;

// Root identity: Pending while the root sits under kPlaceholderNodeId,
// Resolved once it has been re-keyed to its real node id.
enum class RootState {
    Pending,
    Resolved,
};

// ---------------------------------------------------------------------------
// ResourceGraph — mutable node/edge set of one traversal.
//
// Nodes are keyed by ObjectKey::NodeId(). While the root is pending, every
// reference to the root's key lands on the placeholder node instead.
// Nodes are never removed; edges are unique per ordered pair.
// Not synchronized.
// ---------------------------------------------------------------------------
class ResourceGraph {
public:
    /// Seed the root under the placeholder id. Returns false if a root exists.
    bool SetPendingRoot(const Object& root, const ObjectKey& key);

    [[nodiscard]] bool HasRoot() const noexcept { return has_root_; }
    [[nodiscard]] RootState State() const noexcept { return state_; }

    /// Id the root is stored under right now; empty when there is no root.
    [[nodiscard]] std::string RootNodeId() const;

    /// Real id of the root, whether or not it is resolved yet.
    [[nodiscard]] const std::string& SeededRootId() const noexcept { return root_id_; }

    /// Id the object with `key` is (or would be) stored under.
    [[nodiscard]] std::string NodeIdFor(const ObjectKey& key) const;

    /// Record `object`. Returns true for a new node; an existing node gets
    /// its display metadata refreshed and keeps its edges and path.
    bool AddNode(const Object& object, const ObjectKey& key);

    /// Record an edge. Returns false when the source node is unknown or the
    /// edge already exists.
    bool AddEdge(const ObjectKey& from, const ObjectKey& to,
                 EdgeType type = EdgeType::Explicit);

    void SetRootPath(std::string path);

    /// Move the root from the placeholder to its real id and rewrite edges
    /// that point at the placeholder. Idempotent once resolved.
    Result<void, Error> ResolveRoot();

    [[nodiscard]] const NodeMap& Nodes() const noexcept { return nodes_; }
    [[nodiscard]] bool Contains(const std::string& node_id) const {
        return nodes_.count(node_id) > 0;
    }

private:
    NodeMap nodes_;
    bool has_root_ = false;
    RootState state_ = RootState::Pending;
    std::string root_id_;
};

} // namespace dashgraph
