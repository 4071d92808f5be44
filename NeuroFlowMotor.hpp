// NeuroFlow motor generator
//
// Turns the settled graph plus the selected goal into an ordered word sequence.
// Candidate forms come from firing nodes through a Vocabulary; assembly walks a
// part-of-speech transition table from START. The only non-determinism is the
// pick inside the top score tier, drawn from a caller-owned RandomSource.
#pragma once
#include "NeuroFlowGraph.hpp"
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace NeuroFlow {

struct VocabEntry {
    std::vector<NodeId> conceptIds;
    std::string pos;
};

// Word/phrase lookup capability consumed by the generator
class Vocabulary {
public:
    virtual ~Vocabulary() = default;
    // Surface forms associated with a node id, declaration order
    virtual const std::vector<std::string>& wordsForConcept(const NodeId& id) const = 0;
    // Single word first, then multi-word phrase
    virtual std::optional<VocabEntry> lookup(const std::string& form) const = 0;
};

// Seedable integer sequence used for tie-breaks
class RandomSource {
public:
    virtual ~RandomSource() = default;
    // Uniform in [lo, hi], both inclusive
    virtual int uniformInt(int lo, int hi) = 0;
};

class SeededRandom : public RandomSource {
public:
    explicit SeededRandom(unsigned int seed = 42) : rng(seed) {}
    void reseed(unsigned int seed) { rng.seed(seed); }
    int uniformInt(int lo, int hi) override {
        std::uniform_int_distribution<int> dist(lo, hi);
        return dist(rng);
    }

private:
    std::mt19937 rng;
};

struct WordCandidate {
    std::string word;
    NodeId originId;
    double activation = 0.0;
    std::string pos;
    double score = 0.0;
    std::string reason;
};

struct MotorResult {
    std::vector<WordCandidate> candidatesConsidered; // score descending, as scored
    std::vector<WordCandidate> selectedWords;        // selection order
    std::string finalText;
};

struct MotorConfig {
    int maxWords = 15;
    size_t maxConceptSources = 25;
    double conceptScale = 0.6;
    double motorScale = 0.5;
    double repetitionPenalty = 0.3;
    size_t recentWindow = 20; // trailing recent words that count as repeats
    double tierRatio = 0.85;
    double diversityFactor = 0.5;
};

extern const char* const kFallbackUtterance;
extern const char* const kStartState;
extern const char* const kEndState;

// Closed transition table: current tag -> permitted next tags
const std::map<std::string, std::vector<std::string>>& posTransitions();
// Allowed next tags for a state; unknown states fall back to noun/verb/adj
const std::vector<std::string>& allowedAfter(const std::string& state);
// Fixed per-goal affinity; 0.1 for goals not in the table
double goalAffinityBoost(const NodeId& goalId);

MotorResult generateResponse(const Graph& graph, const Vocabulary& vocabulary,
                             const NodeId& goalId, RandomSource& random,
                             const std::vector<std::string>& recentWords,
                             const MotorConfig& config = MotorConfig{});

} // namespace NeuroFlow
