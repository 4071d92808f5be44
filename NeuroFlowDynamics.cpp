// NeuroFlowDynamics.cpp
//
// Implements the per-step passes. Order is fixed: decay, spread, competition,
// clamp. Spread reads only pre-spread activations (deltas are buffered per
// target) and credits |spread| to each edge before competition runs.
#include "NeuroFlowDynamics.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace NeuroFlow {

Modulators defaultModulators() {
    return {{"curiosity", 0.5}, {"calm", 0.5}, {"urgency", 0.3}};
}

DynamicsResult DynamicsEngine::run(Graph& graph, const ActivationMap& injections, const Modulators& modulators) {
    auto t0 = std::chrono::steady_clock::now();
    DynamicsResult result;

    graph.resetActivations();
    graph.resetContributions();

    for (const auto& kv : injections) {
        Node* n = graph.findNode(kv.first);
        if (!n) continue;
        n->activation = std::min(1.0, std::max(0.0, n->activation + kv.second));
    }

    double curiosity = kDefaultCuriosity;
    auto itc = modulators.find("curiosity");
    if (itc != modulators.end()) curiosity = itc->second;

    std::vector<double> deltas(graph.nodeCount(), 0.0);
    std::vector<NodeIndex> firing;
    firing.reserve(graph.nodeCount());
    result.steps.reserve(static_cast<size_t>(std::max(0, config.steps)));

    for (int step = 0; step < config.steps; ++step) {
        decayPass(graph);
        spreadPass(graph, curiosity, deltas);
        if (config.competitionWithinCategory) competitionPass(graph, firing);
        clampPass(graph);
        result.steps.push_back(recordStep(graph, step));
        ++perf.stepsEvaluated;
    }

    result.finalActivations.reserve(graph.nodeCount());
    for (const auto& n : graph.getNodes()) result.finalActivations.emplace_back(n.id, n.activation);

    // Explanation: edges ranked by accumulated contribution, ties by insertion order
    std::vector<EdgeIndex> order(graph.edgeCount());
    for (size_t i = 0; i < order.size(); ++i) order[i] = static_cast<EdgeIndex>(i);
    std::stable_sort(order.begin(), order.end(), [&](EdgeIndex a, EdgeIndex b) {
        return graph.edge(a).contribution > graph.edge(b).contribution;
    });
    if (order.size() > kTopEdges) order.resize(kTopEdges);
    for (EdgeIndex ei : order) {
        const Edge& e = graph.edge(ei);
        result.topContributingEdges.push_back({e.sourceId, e.targetId, e.type, e.contribution});
    }

    auto ns = (unsigned long long)std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - t0).count();
    ++perf.runCount;
    perf.runTimeNsAccum += ns;
    if (ns < perf.runTimeNsMin) perf.runTimeNsMin = ns;
    if (ns > perf.runTimeNsMax) perf.runTimeNsMax = ns;
    return result;
}

void DynamicsEngine::decayPass(Graph& graph) {
    for (size_t i = 0; i < graph.nodeCount(); ++i) {
        Node& n = graph.node(static_cast<NodeIndex>(i));
        n.activation += (n.baseline - n.activation) * n.decay;
    }
}

void DynamicsEngine::spreadPass(Graph& graph, double curiosity, std::vector<double>& deltas) {
    std::fill(deltas.begin(), deltas.end(), 0.0);
    const double associativeScale = 0.5 + curiosity * 0.5;
    for (size_t i = 0; i < graph.edgeCount(); ++i) {
        Edge& e = graph.edge(static_cast<EdgeIndex>(i));
        const Node& src = graph.node(e.source);
        ++perf.edgesEvaluated;
        if (!src.isFiring()) continue;
        double spread = src.activation * e.weight;
        switch (e.type) {
            case EdgeType::Inhibitory: spread = -std::abs(spread); break;
            case EdgeType::Associative: spread *= associativeScale; break;
            case EdgeType::Causal: spread *= kCausalScale; break;
            case EdgeType::Excitatory: break;
        }
        deltas[static_cast<size_t>(e.target)] += spread;
        e.contribution += std::abs(spread);
    }
    for (size_t i = 0; i < deltas.size(); ++i) {
        graph.node(static_cast<NodeIndex>(i)).activation += deltas[i];
    }
}

// Rank-based suppression among firing members of each category. Runs on
// pre-clamp activations.
void DynamicsEngine::competitionPass(Graph& graph, std::vector<NodeIndex>& firing) {
    for (auto category : kAllCategories) {
        const auto& members = graph.membersOf(category);
        if (members.size() <= 1) continue;
        firing.clear();
        for (NodeIndex idx : members) {
            if (graph.node(idx).isFiring()) firing.push_back(idx);
        }
        if (firing.size() <= 1) continue;
        std::stable_sort(firing.begin(), firing.end(), [&](NodeIndex a, NodeIndex b) {
            return graph.node(a).activation > graph.node(b).activation;
        });
        const double count = static_cast<double>(firing.size());
        for (size_t rank = 1; rank < firing.size(); ++rank) {
            graph.node(firing[rank]).activation -= config.inhibitionStrength * (static_cast<double>(rank) / count);
        }
    }
}

void DynamicsEngine::clampPass(Graph& graph) {
    for (size_t i = 0; i < graph.nodeCount(); ++i) graph.node(static_cast<NodeIndex>(i)).clamp();
}

StepRecord DynamicsEngine::recordStep(const Graph& graph, int step) {
    StepRecord record;
    record.step = step;
    for (const auto& n : graph.getNodes()) {
        if (n.isFiring()) record.topFiring.emplace_back(n.id, n.activation);
    }
    std::stable_sort(record.topFiring.begin(), record.topFiring.end(),
                     [](const std::pair<NodeId, double>& a, const std::pair<NodeId, double>& b) {
                         return a.second > b.second;
                     });
    if (record.topFiring.size() > kTopFiringPerStep) record.topFiring.resize(kTopFiringPerStep);
    return record;
}

} // namespace NeuroFlow
