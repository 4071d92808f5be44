// NeuroFlowMotor.cpp
//
// Candidate scoring and the part-of-speech assembly loop.
#include "NeuroFlowMotor.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <fmt/format.h>
#include <unordered_set>

namespace NeuroFlow {

const char* const kFallbackUtterance = "i am processing";
const char* const kStartState = "START";
const char* const kEndState = "END";

const std::map<std::string, std::vector<std::string>>& posTransitions() {
    static const std::map<std::string, std::vector<std::string>> table = {
        {"START", {"noun", "adj", "det", "pronoun", "interjection", "verb", "adverb"}},
        {"det", {"noun", "adj"}},
        {"adj", {"noun", "adj", "conjunction"}},
        {"noun", {"verb", "conjunction", "prep", "noun", "adj", "END"}},
        {"pronoun", {"verb", "adverb"}},
        {"verb", {"noun", "adj", "det", "adverb", "prep", "pronoun", "END"}},
        {"adverb", {"verb", "adj", "adverb", "END"}},
        {"prep", {"noun", "det", "adj", "pronoun"}},
        {"conjunction", {"noun", "det", "adj", "verb", "pronoun"}},
        {"interjection", {"noun", "det", "pronoun", "verb", "END"}},
    };
    return table;
}

const std::vector<std::string>& allowedAfter(const std::string& state) {
    static const std::vector<std::string> fallback = {"noun", "verb", "adj"};
    const auto& table = posTransitions();
    auto it = table.find(state);
    return it == table.end() ? fallback : it->second;
}

double goalAffinityBoost(const NodeId& goalId) {
    static const std::map<NodeId, double> boosts = {
        {"goal_inform", 0.3},
        {"goal_greet", 0.4},
        {"goal_describe", 0.3},
        {"goal_farewell", 0.4},
        {"goal_clarify", 0.2},
    };
    auto it = boosts.find(goalId);
    return it == boosts.end() ? 0.1 : it->second;
}

namespace {

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

MotorResult generateResponse(const Graph& graph, const Vocabulary& vocabulary,
                             const NodeId& goalId, RandomSource& random,
                             const std::vector<std::string>& recentWords,
                             const MotorConfig& config) {
    MotorResult result;
    const size_t keep = std::min(recentWords.size(), config.recentWindow);
    const std::unordered_set<std::string> recent(recentWords.end() - static_cast<std::ptrdiff_t>(keep),
                                                 recentWords.end());

    // Firing concept/topic/emotion nodes; concept nodes carry most lexical
    // mappings and rank first
    struct Source { NodeIndex index; double activation; double priority; };
    std::vector<Source> sources;
    for (size_t i = 0; i < graph.nodeCount(); ++i) {
        const Node& n = graph.node(static_cast<NodeIndex>(i));
        if (!n.isFiring()) continue;
        if (n.category == Category::Concept) sources.push_back({static_cast<NodeIndex>(i), n.activation, 1.0});
        else if (n.category == Category::Topic || n.category == Category::Emotion)
            sources.push_back({static_cast<NodeIndex>(i), n.activation, 0.5});
    }
    std::stable_sort(sources.begin(), sources.end(), [](const Source& a, const Source& b) {
        if (a.priority != b.priority) return a.priority > b.priority;
        return a.activation > b.activation;
    });
    if (sources.size() > config.maxConceptSources) sources.resize(config.maxConceptSources);

    const Node* goalNode = graph.findNode(goalId);
    const double affinity = goalAffinityBoost(goalId);

    std::vector<WordCandidate> candidates;
    for (const auto& s : sources) {
        const Node& origin = graph.node(s.index);
        for (const auto& form : vocabulary.wordsForConcept(origin.id)) {
            auto entry = vocabulary.lookup(form);
            if (!entry) continue;
            WordCandidate c;
            c.word = form;
            c.originId = origin.id;
            c.activation = origin.activation;
            c.pos = entry->pos;
            double score = origin.activation * config.conceptScale;
            if (goalNode) {
                for (EdgeIndex ei : graph.outgoing(goalId)) {
                    const Edge& e = graph.edge(ei);
                    if (e.targetId == origin.id) {
                        score += affinity * std::abs(e.weight);
                        break;
                    }
                }
            }
            if (recent.count(form)) score *= config.repetitionPenalty;
            c.score = score;
            c.reason = fmt::format("concept={} act={:.2f} goal_match={}", origin.id, origin.activation, goalId);
            candidates.push_back(std::move(c));
        }
    }

    for (size_t i = 0; i < graph.nodeCount(); ++i) {
        const Node& n = graph.node(static_cast<NodeIndex>(i));
        if (!n.isFiring()) continue;
        if (n.category != Category::Motor && n.category != Category::Lexeme) continue;
        for (const auto& form : vocabulary.wordsForConcept(n.id)) {
            auto entry = vocabulary.lookup(form);
            if (!entry) continue;
            WordCandidate c;
            c.word = form;
            c.originId = n.id;
            c.activation = n.activation;
            c.pos = entry->pos;
            c.score = n.activation * config.motorScale;
            if (recent.count(form)) c.score *= config.repetitionPenalty;
            c.reason = fmt::format("motor/lexeme node={}", n.id);
            candidates.push_back(std::move(c));
        }
    }

    if (candidates.empty()) {
        result.finalText = kFallbackUtterance;
        return result;
    }

    result.candidatesConsidered = candidates;
    std::stable_sort(result.candidatesConsidered.begin(), result.candidatesConsidered.end(),
                     [](const WordCandidate& a, const WordCandidate& b) { return a.score > b.score; });

    std::string state = kStartState;
    std::unordered_set<std::string> used;
    std::vector<size_t> eligible;
    auto byScore = [&](size_t a, size_t b) { return candidates[a].score > candidates[b].score; };

    for (int n = 0; n < config.maxWords; ++n) {
        const auto& allowed = allowedAfter(state);
        eligible.clear();
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (!used.count(candidates[i].word) && contains(allowed, candidates[i].pos)) eligible.push_back(i);
        }
        if (eligible.empty()) {
            for (size_t i = 0; i < candidates.size(); ++i) {
                if (!used.count(candidates[i].word)) eligible.push_back(i);
            }
            if (eligible.empty()) break;
        }
        std::stable_sort(eligible.begin(), eligible.end(), byScore);

        const double cutoff = candidates[eligible.front()].score * config.tierRatio;
        size_t tierSize = 0;
        while (tierSize < eligible.size() && candidates[eligible[tierSize]].score >= cutoff) ++tierSize;

        size_t chosen = eligible.front();
        if (tierSize > 1) chosen = eligible[static_cast<size_t>(random.uniformInt(0, static_cast<int>(tierSize) - 1))];

        const WordCandidate& pick = candidates[chosen];
        result.selectedWords.push_back(pick);
        used.insert(pick.word);
        state = pick.pos;

        if (state == kEndState || static_cast<int>(result.selectedWords.size()) >= config.maxWords) break;

        // Diversity pressure on the rest of the chosen origin's forms
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (i != chosen && candidates[i].originId == pick.originId) candidates[i].score *= config.diversityFactor;
        }
    }

    for (size_t i = 0; i < result.selectedWords.size(); ++i) {
        if (i) result.finalText += ' ';
        result.finalText += result.selectedWords[i].word;
    }
    return result;
}

} // namespace NeuroFlow
