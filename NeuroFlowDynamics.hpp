// NeuroFlow dynamics engine
//
// Fixed-step activation spreading over a Graph: decay toward baseline, spread
// along typed edges, same-category competition, clamp. Every pass walks nodes
// and edges in insertion order so step records and contribution rankings are
// reproducible bit for bit.
#pragma once
#include "NeuroFlowGraph.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace NeuroFlow {

// Node id -> amount added to the node's activation before the first step
using ActivationMap = std::map<NodeId, double>;
// Named session parameters in [0,1] (e.g. "curiosity")
using Modulators = std::map<std::string, double>;

// Modulator values used when a caller has none of its own
Modulators defaultModulators();

struct DynamicsConfig {
    int steps = 20;
    double inhibitionStrength = 0.15;
    bool competitionWithinCategory = true;
};

struct StepRecord {
    int step = 0;
    std::vector<std::pair<NodeId, double>> topFiring; // activation descending, at most 8
};

struct EdgeContribution {
    NodeId sourceId;
    NodeId targetId;
    EdgeType type = EdgeType::Excitatory;
    double contribution = 0.0;
};

struct DynamicsResult {
    std::vector<StepRecord> steps;
    std::vector<std::pair<NodeId, double>> finalActivations; // node insertion order
    std::vector<EdgeContribution> topContributingEdges;      // at most 10
};

// DynamicsEngine runs the simulation; it holds no graph state between runs,
// only its configuration and perf counters.
class DynamicsEngine {
public:
    static constexpr size_t kTopFiringPerStep = 8;
    static constexpr size_t kTopEdges = 10;
    static constexpr double kDefaultCuriosity = 0.5;
    static constexpr double kCausalScale = 0.8;

    DynamicsEngine() = default;
    explicit DynamicsEngine(DynamicsConfig config) : config(config) {}

    const DynamicsConfig& getConfig() const { return config; }
    void setConfig(const DynamicsConfig& c) { config = c; }

    // Reset, inject, iterate. Unknown ids in injections are ignored.
    DynamicsResult run(Graph& graph, const ActivationMap& injections, const Modulators& modulators);

    // Performance counters (lightweight; resettable; never affect results)
    struct PerfStats {
        unsigned long long runCount = 0;
        unsigned long long stepsEvaluated = 0;
        unsigned long long edgesEvaluated = 0;
        unsigned long long runTimeNsAccum = 0;
        unsigned long long runTimeNsMin = (unsigned long long)-1;
        unsigned long long runTimeNsMax = 0;
    };
    PerfStats getAndResetPerfStats() {
        PerfStats out = perf;
        perf = PerfStats{};
        return out;
    }

private:
    DynamicsConfig config;
    PerfStats perf;

    void decayPass(Graph& graph);
    void spreadPass(Graph& graph, double curiosity, std::vector<double>& deltas);
    void competitionPass(Graph& graph, std::vector<NodeIndex>& firing);
    static void clampPass(Graph& graph);
    static StepRecord recordStep(const Graph& graph, int step);
};

} // namespace NeuroFlow
