// NeuroFlowMemory.cpp
#include "NeuroFlowMemory.hpp"
#include <algorithm>
#include <set>

namespace NeuroFlow {

void Memory::storeTurn(const std::string& userText, const std::string& systemText,
                       const std::vector<NodeId>& concepts, const NodeId& goal) {
    ++turns;
    stm.emplace_back(userText, systemText);
    while (stm.size() > stmCapacity) stm.pop_front();
    episodic.push_back(Episode{turns, userText, systemText, concepts, goal});
    while (episodic.size() > episodicCapacity) episodic.pop_front();
}

std::vector<Episode> Memory::retrieveRelevant(const std::vector<NodeId>& concepts, size_t topK) const {
    if (episodic.empty() || concepts.empty()) return {};
    const std::set<NodeId> wanted(concepts.begin(), concepts.end());

    std::vector<std::pair<double, const Episode*>> scored;
    for (const auto& ep : episodic) {
        const std::set<NodeId> have(ep.concepts.begin(), ep.concepts.end());
        size_t overlap = 0;
        for (const auto& c : have) overlap += wanted.count(c);
        if (overlap == 0) continue;
        double recency = static_cast<double>(ep.turnId) / static_cast<double>(std::max(1, turns));
        scored.emplace_back(static_cast<double>(overlap) + recency * kRecencyWeight, &ep);
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const std::pair<double, const Episode*>& a, const std::pair<double, const Episode*>& b) {
                         return a.first > b.first;
                     });
    std::vector<Episode> out;
    for (size_t i = 0; i < scored.size() && i < topK; ++i) out.push_back(*scored[i].second);
    return out;
}

std::vector<NodeId> Memory::recentConcepts() const {
    std::vector<NodeId> out;
    size_t start = episodic.size() > 3 ? episodic.size() - 3 : 0;
    for (size_t i = start; i < episodic.size(); ++i) {
        out.insert(out.end(), episodic[i].concepts.begin(), episodic[i].concepts.end());
    }
    return out;
}

ActivationMap Memory::memoryBoost(const std::vector<NodeId>& concepts) const {
    ActivationMap boosts;
    for (const auto& ep : retrieveRelevant(concepts)) {
        for (const auto& c : ep.concepts) boosts[c] += kBoostPerEpisode;
    }
    for (auto& kv : boosts) kv.second = std::min(kMaxBoost, kv.second);
    return boosts;
}

} // namespace NeuroFlow
