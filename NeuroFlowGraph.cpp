// NeuroFlowGraph.cpp
//
// Graph arena: insertion with duplicate/dangling checks, adjacency upkeep,
// reset primitives and the structural validation pass.
#include "NeuroFlowGraph.hpp"
#include <fmt/core.h>

namespace NeuroFlow {

namespace {
const std::vector<EdgeIndex> kNoEdges;
}

const char* categoryName(Category c) {
    switch (c) {
        case Category::Concept: return "concept";
        case Category::Topic: return "topic";
        case Category::Emotion: return "emotion";
        case Category::Goal: return "goal";
        case Category::Motor: return "motor";
        case Category::Lexeme: return "lexeme";
    }
    return "concept";
}

const char* edgeTypeName(EdgeType t) {
    switch (t) {
        case EdgeType::Excitatory: return "excitatory";
        case EdgeType::Inhibitory: return "inhibitory";
        case EdgeType::Associative: return "associative";
        case EdgeType::Causal: return "causal";
    }
    return "excitatory";
}

Category parseCategory(const std::string& name) {
    for (auto c : kAllCategories) {
        if (name == categoryName(c)) return c;
    }
    throw std::invalid_argument(fmt::format(
        "Invalid node type '{}', must be one of concept, topic, emotion, goal, motor, lexeme", name));
}

EdgeType parseEdgeType(const std::string& name) {
    for (auto t : kAllEdgeTypes) {
        if (name == edgeTypeName(t)) return t;
    }
    throw std::invalid_argument(fmt::format(
        "Invalid edge type '{}', must be one of excitatory, inhibitory, associative, causal", name));
}

void Graph::addNode(Node node) {
    if (nodeIndex.count(node.id)) throw DuplicateIdentifier(node.id);
    NodeIndex idx = static_cast<NodeIndex>(nodes.size());
    nodeIndex.emplace(node.id, idx);
    categoryMembers[static_cast<size_t>(node.category)].push_back(idx);
    outEdges.emplace_back();
    inEdges.emplace_back();
    nodes.push_back(std::move(node));
}

void Graph::addEdge(Edge edge) {
    NodeIndex src = indexOf(edge.sourceId);
    if (src < 0) throw DanglingReference("source", edge.sourceId);
    NodeIndex dst = indexOf(edge.targetId);
    if (dst < 0) throw DanglingReference("target", edge.targetId);
    if (edge.weight < -1.0 || edge.weight > 1.0) {
        throw std::out_of_range(fmt::format("Weight {} out of range [-1, 1]", edge.weight));
    }
    edge.source = src;
    edge.target = dst;
    edge.contribution = 0.0;
    EdgeIndex ei = static_cast<EdgeIndex>(edges.size());
    edges.push_back(std::move(edge));
    outEdges[static_cast<size_t>(src)].push_back(ei);
    inEdges[static_cast<size_t>(dst)].push_back(ei);
}

NodeIndex Graph::indexOf(const NodeId& id) const {
    auto it = nodeIndex.find(id);
    if (it == nodeIndex.end()) return -1;
    return it->second;
}

Node* Graph::findNode(const NodeId& id) {
    NodeIndex i = indexOf(id);
    return i < 0 ? nullptr : &nodes[static_cast<size_t>(i)];
}

const Node* Graph::findNode(const NodeId& id) const {
    NodeIndex i = indexOf(id);
    return i < 0 ? nullptr : &nodes[static_cast<size_t>(i)];
}

std::vector<const Node*> Graph::nodesByCategory(Category category) const {
    std::vector<const Node*> out;
    for (NodeIndex i : membersOf(category)) out.push_back(&nodes[static_cast<size_t>(i)]);
    return out;
}

const std::vector<EdgeIndex>& Graph::outgoing(const NodeId& id) const {
    NodeIndex i = indexOf(id);
    return i < 0 ? kNoEdges : outEdges[static_cast<size_t>(i)];
}

const std::vector<EdgeIndex>& Graph::incoming(const NodeId& id) const {
    NodeIndex i = indexOf(id);
    return i < 0 ? kNoEdges : inEdges[static_cast<size_t>(i)];
}

void Graph::resetActivations() {
    for (auto& n : nodes) n.reset();
}

void Graph::resetContributions() {
    for (auto& e : edges) e.contribution = 0.0;
}

std::vector<std::string> Graph::validate() const {
    std::vector<std::string> problems;
    for (const auto& e : edges) {
        if (!nodeIndex.count(e.sourceId)) problems.push_back("Edge references missing source: " + e.sourceId);
        if (!nodeIndex.count(e.targetId)) problems.push_back("Edge references missing target: " + e.targetId);
    }
    if (membersOf(Category::Goal).empty()) problems.push_back("No goal nodes defined in graph");
    return problems;
}

std::string Graph::summary() const {
    return fmt::format("{} nodes, {} edges", nodes.size(), edges.size());
}

} // namespace NeuroFlow
