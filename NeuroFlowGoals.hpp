// NeuroFlow goal arbitration
//
// Ranks goal-category nodes of a settled graph. The best goal is always
// selected, firing or not; only a graph without goal nodes yields no selection.
#pragma once
#include "NeuroFlowGraph.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace NeuroFlow {

struct GoalResult {
    std::vector<std::pair<NodeId, double>> candidates; // activation descending
    std::optional<NodeId> selectedGoal;
    double selectedActivation = 0.0;
};

GoalResult selectGoal(const Graph& graph);

} // namespace NeuroFlow
