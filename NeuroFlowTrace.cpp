// NeuroFlowTrace.cpp
//
// Text and JSON renderings of a turn trace.
#include "NeuroFlowTrace.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>

namespace NeuroFlow {

namespace {

std::string joinIds(const std::vector<NodeId>& ids) {
    std::string s = "[";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i) s += ", ";
        s += ids[i];
    }
    return s + "]";
}

std::string joinActivations(const std::vector<std::pair<NodeId, double>>& items, size_t limit, int precision) {
    std::string s;
    for (size_t i = 0; i < items.size() && i < limit; ++i) {
        if (i) s += ", ";
        s += fmt::format("{}={:.{}f}", items[i].first, items[i].second, precision);
    }
    return s;
}

std::string joinWords(const std::vector<std::string>& words) {
    std::string s;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i) s += ' ';
        s += words[i];
    }
    return s;
}

std::vector<std::pair<NodeId, double>> byValueDescending(const ActivationMap& m) {
    std::vector<std::pair<NodeId, double>> v(m.begin(), m.end());
    std::stable_sort(v.begin(), v.end(),
                     [](const std::pair<NodeId, double>& a, const std::pair<NodeId, double>& b) {
                         return a.second > b.second;
                     });
    return v;
}

} // namespace

std::string Trace::formatCompact() const {
    std::string out = "--- THOUGHT TRACE ---\n";

    if (!inputMapping.empty()) {
        out += "  Input -> Concepts:\n";
        for (const auto& m : inputMapping) out += fmt::format("    '{}' -> {}\n", m.first, joinIds(m.second));
    }
    if (!initialActivations.empty()) {
        out += "  Initial Activations:\n";
        auto sorted = byValueDescending(initialActivations);
        for (size_t i = 0; i < sorted.size() && i < 5; ++i) {
            out += fmt::format("    {}: {:.3f}\n", sorted[i].first, sorted[i].second);
        }
    }
    if (!modulators.empty()) {
        std::string mods;
        for (const auto& kv : modulators) {
            if (!mods.empty()) mods += ", ";
            mods += fmt::format("{}={:.2f}", kv.first, kv.second);
        }
        out += fmt::format("  Modulators: {}\n", mods);
    }
    if (!stepRecords.empty()) {
        // First, middle and last step
        std::vector<const StepRecord*> shown;
        const size_t n = stepRecords.size();
        shown.push_back(&stepRecords.front());
        if (n >= 3) shown.push_back(&stepRecords[n / 2]);
        if (n >= 2) shown.push_back(&stepRecords.back());
        out += "  Dynamics (selected steps):\n";
        for (const auto* sr : shown) out += fmt::format("    Step {}: [{}]\n", sr->step, joinActivations(sr->topFiring, 4, 2));
    }
    if (!topEdges.empty()) {
        out += "  Top Routes (edges):\n";
        for (size_t i = 0; i < topEdges.size() && i < 5; ++i) {
            const auto& e = topEdges[i];
            out += fmt::format("    {} -({})-> {}  contrib={:.3f}\n", e.sourceId, edgeTypeName(e.type), e.targetId, e.contribution);
        }
    }
    if (!memoryEffects.empty()) {
        out += "  Memory Boost:\n";
        for (const auto& kv : memoryEffects) out += fmt::format("    {}: +{:.3f}\n", kv.first, kv.second);
    }
    if (!selectedGoal.empty()) {
        out += fmt::format("  Goal: {}\n", selectedGoal);
        if (!goalCandidates.empty()) out += fmt::format("    Candidates: [{}]\n", joinActivations(goalCandidates, 4, 2));
    }
    if (!languageSelected.empty()) {
        out += "  Word Selection:\n";
        for (size_t i = 0; i < languageSelected.size() && i < 8; ++i) {
            const auto& wc = languageSelected[i];
            out += fmt::format("    '{}' score={:.3f} ({})\n", wc.word, wc.score, wc.reason);
        }
    }
    if (!finalWords.empty()) out += fmt::format("  Output: {}\n", joinWords(finalWords));
    out += "---------------------";
    return out;
}

std::string Trace::formatFull() const {
    std::string out = "=== FULL THOUGHT TRACE ===\n";

    out += "\n[INPUT MAPPING]\n";
    for (const auto& m : inputMapping) out += fmt::format("  '{}' -> {}\n", m.first, joinIds(m.second));

    out += "\n[INITIAL ACTIVATIONS]\n";
    for (const auto& kv : byValueDescending(initialActivations)) {
        if (kv.second > 0.0) out += fmt::format("  {}: {:.4f}\n", kv.first, kv.second);
    }

    out += "\n[MODULATORS]\n";
    for (const auto& kv : modulators) out += fmt::format("  {}: {:.3f}\n", kv.first, kv.second);

    out += "\n[DYNAMICS STEPS]\n";
    for (const auto& sr : stepRecords) out += fmt::format("  Step {:2d}: [{}]\n", sr.step, joinActivations(sr.topFiring, 6, 3));

    out += "\n[TOP CONTRIBUTING EDGES]\n";
    for (const auto& e : topEdges) {
        out += fmt::format("  {} -({})-> {}  contribution={:.4f}\n", e.sourceId, edgeTypeName(e.type), e.targetId, e.contribution);
    }

    out += "\n[MEMORY EFFECTS]\n";
    if (memoryEffects.empty()) out += "  (none)\n";
    for (const auto& kv : memoryEffects) out += fmt::format("  {}: +{:.4f}\n", kv.first, kv.second);

    out += "\n[GOAL SELECTION]\n";
    out += fmt::format("  Selected: {}\n", selectedGoal);
    for (const auto& g : goalCandidates) {
        out += fmt::format("    {}: {:.4f}{}\n", g.first, g.second, g.first == selectedGoal ? " <" : "");
    }

    out += "\n[LANGUAGE CANDIDATES]\n";
    for (size_t i = 0; i < languageCandidates.size() && i < 15; ++i) {
        const auto& wc = languageCandidates[i];
        out += fmt::format("  '{}' pos={} score={:.3f} | {}\n", wc.word, wc.pos, wc.score, wc.reason);
    }

    out += "\n[SELECTED WORDS]\n";
    for (size_t i = 0; i < languageSelected.size(); ++i) {
        const auto& wc = languageSelected[i];
        out += fmt::format("  {}. '{}' pos={} score={:.3f}\n", i + 1, wc.word, wc.pos, wc.score);
    }

    out += fmt::format("\n[OUTPUT] {}\n", joinWords(finalWords));
    out += "==========================";
    return out;
}

nlohmann::json Trace::toJson() const {
    nlohmann::json j;
    j["type"] = "trace";
    j["input_mapping"] = nlohmann::json::array();
    for (const auto& m : inputMapping) j["input_mapping"].push_back({{"text", m.first}, {"concepts", m.second}});
    j["initial_activations"] = initialActivations;
    j["modulators"] = modulators;
    j["steps"] = nlohmann::json::array();
    for (const auto& sr : stepRecords) {
        nlohmann::json top = nlohmann::json::array();
        for (const auto& t : sr.topFiring) top.push_back({{"id", t.first}, {"activation", t.second}});
        j["steps"].push_back({{"step", sr.step}, {"top", top}});
    }
    j["top_edges"] = nlohmann::json::array();
    for (const auto& e : topEdges) {
        j["top_edges"].push_back({{"source", e.sourceId}, {"target", e.targetId},
                                  {"type", edgeTypeName(e.type)}, {"contribution", e.contribution}});
    }
    j["memory_effects"] = memoryEffects;
    j["goal"] = selectedGoal;
    j["goal_candidates"] = nlohmann::json::array();
    for (const auto& g : goalCandidates) j["goal_candidates"].push_back({{"id", g.first}, {"activation", g.second}});
    auto words = [](const std::vector<WordCandidate>& list, size_t limit) {
        nlohmann::json arr = nlohmann::json::array();
        for (size_t i = 0; i < list.size() && i < limit; ++i) {
            const auto& wc = list[i];
            arr.push_back({{"word", wc.word}, {"origin", wc.originId}, {"pos", wc.pos},
                           {"activation", wc.activation}, {"score", wc.score}, {"reason", wc.reason}});
        }
        return arr;
    };
    j["candidates"] = words(languageCandidates, 15);
    j["selected"] = words(languageSelected, languageSelected.size());
    j["output"] = joinWords(finalWords);
    return j;
}

std::unique_ptr<std::ofstream> openNdjsonOutput(const std::string& path, bool append) {
    auto out = std::make_unique<std::ofstream>(path, append ? std::ios::app : std::ios::trunc);
    if (!out->good()) throw std::runtime_error(fmt::format("cannot open output file '{}'", path));
    return out;
}

} // namespace NeuroFlow
