// NeuroFlow graph model
//
// This header defines the labeled activation graph: nodes with a category and
// rest/decay/threshold parameters, typed weighted edges, and the Graph arena
// that owns them. Nodes live in a vector indexed by a compact integer; an
// id->index table is built once on insert so the per-step passes never do
// identifier lookups.
#pragma once
#include <array>
#include <map>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace NeuroFlow {

using NodeId = std::string;
using NodeIndex = int;
using EdgeIndex = int;

enum class Category { Concept, Topic, Emotion, Goal, Motor, Lexeme };
enum class EdgeType { Excitatory, Inhibitory, Associative, Causal };

// Fixed iteration order for per-category passes
constexpr std::array<Category, 6> kAllCategories = {
    Category::Concept, Category::Topic, Category::Emotion,
    Category::Goal, Category::Motor, Category::Lexeme,
};
constexpr std::array<EdgeType, 4> kAllEdgeTypes = {
    EdgeType::Excitatory, EdgeType::Inhibitory, EdgeType::Associative, EdgeType::Causal,
};

const char* categoryName(Category c);
const char* edgeTypeName(EdgeType t);
// Throws std::invalid_argument for names outside the closed sets
Category parseCategory(const std::string& name);
EdgeType parseEdgeType(const std::string& name);

// Raised by Graph::addNode when the id is already present
class DuplicateIdentifier : public std::runtime_error {
public:
    explicit DuplicateIdentifier(const NodeId& id)
        : std::runtime_error("Duplicate node id: " + id), id(id) {}
    NodeId id;
};

// Raised by Graph::addEdge when an endpoint was never inserted
class DanglingReference : public std::runtime_error {
public:
    DanglingReference(const std::string& role, const NodeId& id)
        : std::runtime_error("Edge " + role + " '" + id + "' not found in graph"), id(id) {}
    NodeId id;
};

struct Node {
    NodeId id;
    Category category = Category::Concept;
    std::string label;
    double activation = 0.0;
    double baseline = 0.0;
    double decay = 0.05;     // fraction of the distance to baseline recovered per step
    double threshold = 0.3;  // firing level
    // Opaque attachment; no effect on simulation or generation
    std::map<std::string, std::string> metadata;

    Node() = default;
    Node(NodeId id, Category category, std::string label,
         double baseline = 0.0, double decay = 0.05, double threshold = 0.3)
        : id(std::move(id)), category(category), label(std::move(label)),
          activation(baseline), baseline(baseline), decay(decay), threshold(threshold) {}

    void reset() { activation = baseline; }
    void clamp() {
        if (activation < 0.0) activation = 0.0;
        else if (activation > 1.0) activation = 1.0;
    }
    bool isFiring() const { return activation >= threshold; }
};

struct Edge {
    NodeId sourceId;
    NodeId targetId;
    EdgeType type = EdgeType::Excitatory;
    double weight = 0.5;        // [-1, 1]
    double contribution = 0.0;  // running |spread| total for the current run
    // Resolved by Graph::addEdge
    NodeIndex source = -1;
    NodeIndex target = -1;

    Edge() = default;
    Edge(NodeId sourceId, NodeId targetId, EdgeType type, double weight = 0.5)
        : sourceId(std::move(sourceId)), targetId(std::move(targetId)), type(type), weight(weight) {}
};

// Graph owns all nodes and edges and keeps the adjacency indices consistent
// with the edge list. There is no removal operation.
class Graph {
public:
    Graph() = default;

    void addNode(Node node);
    void addEdge(Edge edge);

    // Index of a node id, -1 if absent
    NodeIndex indexOf(const NodeId& id) const;
    Node* findNode(const NodeId& id);
    const Node* findNode(const NodeId& id) const;

    std::vector<const Node*> nodesByCategory(Category category) const;
    const std::vector<NodeIndex>& membersOf(Category category) const {
        return categoryMembers[static_cast<size_t>(category)];
    }

    // Edge indices; empty for unknown ids
    const std::vector<EdgeIndex>& outgoing(const NodeId& id) const;
    const std::vector<EdgeIndex>& incoming(const NodeId& id) const;

    const std::vector<Node>& getNodes() const { return nodes; }
    const std::vector<Edge>& getEdges() const { return edges; }
    Node& node(NodeIndex i) { return nodes[static_cast<size_t>(i)]; }
    const Node& node(NodeIndex i) const { return nodes[static_cast<size_t>(i)]; }
    Edge& edge(EdgeIndex i) { return edges[static_cast<size_t>(i)]; }
    const Edge& edge(EdgeIndex i) const { return edges[static_cast<size_t>(i)]; }
    size_t nodeCount() const { return nodes.size(); }
    size_t edgeCount() const { return edges.size(); }

    void resetActivations();
    void resetContributions();

    // Structural problems in a stable order; never throws
    std::vector<std::string> validate() const;
    std::string summary() const;

private:
    std::vector<Node> nodes;
    std::vector<Edge> edges;
    std::unordered_map<NodeId, NodeIndex> nodeIndex;
    std::vector<std::vector<EdgeIndex>> outEdges; // by source index
    std::vector<std::vector<EdgeIndex>> inEdges;  // by target index
    std::array<std::vector<NodeIndex>, kAllCategories.size()> categoryMembers;
};

} // namespace NeuroFlow
