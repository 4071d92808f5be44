// NeuroFlow trace
//
// Read-only record of one conversational turn (perception mapping, injections,
// dynamics steps, top edges, memory effects, goal ranking, word selection) and
// its renderings: compact and full text for the shell, JSON for export.
#pragma once
#include "NeuroFlowDynamics.hpp"
#include "NeuroFlowMotor.hpp"
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace NeuroFlow {

struct Trace {
    std::vector<std::pair<std::string, std::vector<NodeId>>> inputMapping;
    ActivationMap initialActivations;
    Modulators modulators;
    std::vector<StepRecord> stepRecords;
    std::vector<EdgeContribution> topEdges;
    ActivationMap memoryEffects;
    NodeId selectedGoal;
    std::vector<std::pair<NodeId, double>> goalCandidates;
    std::vector<WordCandidate> languageCandidates;
    std::vector<WordCandidate> languageSelected;
    std::vector<std::string> finalWords;

    std::string formatCompact() const;
    std::string formatFull() const;
    nlohmann::json toJson() const;
};

// Opens an NDJSON output file (trace or perf lines); throws std::runtime_error
// when the file cannot be opened for writing
std::unique_ptr<std::ofstream> openNdjsonOutput(const std::string& path, bool append);

} // namespace NeuroFlow
