#pragma once

#include <dashgraph/graph/resource_graph.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace dashgraph {

struct ComponentMetadata {
    std::string type;
    std::string title;
};

// ---------------------------------------------------------------------------
// ResourceViewerComponent — immutable snapshot of a resource graph, handed
// to the rendering layer.
//
// A new traversal produces a new component; a component never changes after
// construction, so it can be shared across threads freely.
// ---------------------------------------------------------------------------
class ResourceViewerComponent {
public:
    static constexpr const char* kType = "resourceViewer";
    static constexpr const char* kTitle = "Resource Viewer";

    ResourceViewerComponent(NodeMap nodes, std::string selected);

    [[nodiscard]] const ComponentMetadata& Metadata() const noexcept { return metadata_; }
    [[nodiscard]] const NodeMap& Nodes() const noexcept { return nodes_; }

    /// Id of the root node (placeholder id while the root is pending).
    [[nodiscard]] const std::string& Selected() const noexcept { return selected_; }

    [[nodiscard]] bool IsEmpty() const noexcept { return nodes_.empty(); }

    /// Node with `id`, or nullptr.
    [[nodiscard]] const Node* FindNode(const std::string& id) const;

    /// Same nodes, edges and selection.
    [[nodiscard]] bool SameContent(const ResourceViewerComponent& other) const;

    // {"metadata": {"type": "resourceViewer",
    //               "title": [{"metadata": {"type": "text"},
    //                          "config": {"text": "Resource Viewer"}}]},
    //  "config": {"nodes": {...}, "edges": {...}, "selected": "..."}}
    [[nodiscard]] nlohmann::json ToJson() const;

private:
    ComponentMetadata metadata_;
    NodeMap nodes_;
    std::string selected_;
};

using ComponentPtr = std::shared_ptr<const ResourceViewerComponent>;

} // namespace dashgraph
