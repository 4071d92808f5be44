// NeuroFlow memory
//
// Short-term turn pairs and a bounded episodic store. Recall scores episodes
// by concept overlap plus a small recency term and turns the winners into an
// additive activation boost for the next simulation run.
#pragma once
#include "NeuroFlowDynamics.hpp"
#include <deque>
#include <string>
#include <utility>
#include <vector>

namespace NeuroFlow {

struct Episode {
    int turnId = 0;
    std::string userText;
    std::string systemText;
    std::vector<NodeId> concepts;
    NodeId goal;
};

class Memory {
public:
    static constexpr double kBoostPerEpisode = 0.15;
    static constexpr double kMaxBoost = 0.4;
    static constexpr double kRecencyWeight = 0.3;

    explicit Memory(size_t stmCapacity = 5, size_t episodicCapacity = 50)
        : stmCapacity(stmCapacity), episodicCapacity(episodicCapacity) {}

    void storeTurn(const std::string& userText, const std::string& systemText,
                   const std::vector<NodeId>& concepts, const NodeId& goal);

    // Overlapping episodes, best first
    std::vector<Episode> retrieveRelevant(const std::vector<NodeId>& concepts, size_t topK = 3) const;
    // Concepts of the last three episodes, oldest first
    std::vector<NodeId> recentConcepts() const;
    ActivationMap memoryBoost(const std::vector<NodeId>& concepts) const;

    const std::deque<std::pair<std::string, std::string>>& shortTerm() const { return stm; }
    const std::deque<Episode>& episodes() const { return episodic; }
    int turnCounter() const { return turns; }

private:
    size_t stmCapacity;
    size_t episodicCapacity;
    std::deque<std::pair<std::string, std::string>> stm;
    std::deque<Episode> episodic;
    int turns = 0;
};

} // namespace NeuroFlow
