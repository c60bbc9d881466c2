#include <dashgraph/component/resource_viewer_component.hpp>

#include <utility>

namespace dashgraph {

ResourceViewerComponent::ResourceViewerComponent(NodeMap nodes, std::string selected)
    : metadata_{kType, kTitle},
      nodes_(std::move(nodes)),
      selected_(std::move(selected)) {}

const Node* ResourceViewerComponent::FindNode(const std::string& id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool ResourceViewerComponent::SameContent(const ResourceViewerComponent& other) const {
    return nodes_ == other.nodes_ && selected_ == other.selected_;
}

nlohmann::json ResourceViewerComponent::ToJson() const {
    nlohmann::json nodes = nlohmann::json::object();
    nlohmann::json edges = nlohmann::json::object();

    for (const auto& [id, node] : nodes_) {
        nodes[id] = {
            {"name", node.name},
            {"apiVersion", node.api_version},
            {"kind", node.kind},
            {"namespace", node.namespace_name},
            {"path", node.path},
        };
        if (node.edges.empty()) {
            continue;
        }
        nlohmann::json adjacent = nlohmann::json::array();
        for (const auto& edge : node.edges) {
            adjacent.push_back({{"node", edge.node}, {"edge", EdgeTypeName(edge.type)}});
        }
        edges[id] = std::move(adjacent);
    }

    nlohmann::json title = nlohmann::json::array();
    title.push_back({
        {"metadata", {{"type", "text"}}},
        {"config", {{"text", metadata_.title}}},
    });

    return {
        {"metadata", {{"type", metadata_.type}, {"title", std::move(title)}}},
        {"config", {{"nodes", std::move(nodes)},
                    {"edges", std::move(edges)},
                    {"selected", selected_}}},
    };
}

} // namespace dashgraph
