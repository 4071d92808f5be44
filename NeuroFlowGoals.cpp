// NeuroFlowGoals.cpp
#include "NeuroFlowGoals.hpp"
#include <algorithm>

namespace NeuroFlow {

GoalResult selectGoal(const Graph& graph) {
    GoalResult result;
    for (NodeIndex idx : graph.membersOf(Category::Goal)) {
        const Node& g = graph.node(idx);
        result.candidates.emplace_back(g.id, g.activation);
    }
    if (result.candidates.empty()) return result;

    std::stable_sort(result.candidates.begin(), result.candidates.end(),
                     [](const std::pair<NodeId, double>& a, const std::pair<NodeId, double>& b) {
                         return a.second > b.second;
                     });
    result.selectedGoal = result.candidates.front().first;
    result.selectedActivation = result.candidates.front().second;
    return result;
}

} // namespace NeuroFlow
