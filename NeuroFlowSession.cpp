// NeuroFlowSession.cpp
//
// Turn pipeline and the small session-level bookkeeping around it (recent
// words window, modulator drift, seed control, summaries for the shell).
#include "NeuroFlowSession.hpp"
#include "NeuroFlowLoader.hpp"
#include <algorithm>
#include <chrono>
#include <fmt/format.h>

namespace NeuroFlow {

Session::Session(SessionConfig cfg)
    : config(std::move(cfg)),
      lexicon(loadLexicon(config.lexiconPath)),
      graph(loadGraph(config.graphPath)),
      perception(std::make_unique<InputProcessor>(lexicon)),
      dynamics(config.dynamics),
      modulators(config.modulators),
      random(config.seed) {}

Session::Session(SessionConfig cfg, Lexicon lex, Graph g)
    : config(std::move(cfg)),
      lexicon(std::move(lex)),
      graph(std::move(g)),
      perception(std::make_unique<InputProcessor>(lexicon)),
      dynamics(config.dynamics),
      modulators(config.modulators),
      random(config.seed) {}

TurnResult Session::processInput(const std::string& userInput) {
    auto t0 = std::chrono::steady_clock::now();
    ++turns;
    TurnResult turn;
    Trace& trace = turn.trace;

    // 1. Perception
    PerceptionResult perceived = perception->process(userInput);
    for (const auto& w : perceived.matchedWords) trace.inputMapping.push_back(w);
    for (const auto& p : perceived.matchedPhrases) trace.inputMapping.push_back(p);
    trace.initialActivations = perceived.activatedConcepts;
    trace.modulators = modulators;

    // 2. Memory boost, added on top of perception
    std::vector<NodeId> currentConcepts;
    for (const auto& kv : perceived.activatedConcepts) currentConcepts.push_back(kv.first);
    ActivationMap boost = memory.memoryBoost(currentConcepts);
    trace.memoryEffects = boost;
    ActivationMap injections = perceived.activatedConcepts;
    for (const auto& kv : boost) injections[kv.first] += kv.second;

    // 3. Dynamics
    DynamicsResult settled = dynamics.run(graph, injections, modulators);
    trace.stepRecords = std::move(settled.steps);
    trace.topEdges = std::move(settled.topContributingEdges);

    // 4. Goal arbitration; an empty goal set falls back to the configured default
    GoalResult goal = selectGoal(graph);
    trace.selectedGoal = goal.selectedGoal ? *goal.selectedGoal : config.defaultGoal;
    trace.goalCandidates = goal.candidates;

    // 5. Generation
    MotorResult motor = generateResponse(graph, lexicon, trace.selectedGoal, random, recentWords, config.motor);
    trace.languageCandidates = motor.candidatesConsidered;
    if (trace.languageCandidates.size() > 15) trace.languageCandidates.resize(15);
    trace.languageSelected = motor.selectedWords;
    for (const auto& w : motor.selectedWords) trace.finalWords.push_back(w.word);
    turn.response = motor.finalText;

    recentWords.insert(recentWords.end(), trace.finalWords.begin(), trace.finalWords.end());
    if (recentWords.size() > config.recentWordWindow) {
        recentWords.erase(recentWords.begin(), recentWords.end() - static_cast<std::ptrdiff_t>(config.recentWordWindow));
    }

    // 6. Memory
    memory.storeTurn(userInput, turn.response, currentConcepts, trace.selectedGoal);

    updateModulators(perceived);

    turn.elapsedMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    return turn;
}

// Questions raise curiosity; everything else lets it and urgency relax
void Session::updateModulators(const PerceptionResult& perceived) {
    double& curiosity = modulators["curiosity"];
    if (perceived.rawInput.find('?') != std::string::npos) curiosity = std::min(1.0, curiosity + 0.1);
    else curiosity = std::max(0.2, curiosity - 0.05);
    double& urgency = modulators["urgency"];
    urgency = std::max(0.1, urgency - 0.02);
}

std::string Session::startupSummary() const {
    return fmt::format("NeuroFlow Conversation Engine\n"
                       "Mode: CPU-only | Deterministic\n"
                       "Brain loaded: {}\n"
                       "Lexicon loaded: {}\n"
                       "Seed: {}\n"
                       "Type 'exit' to quit.",
                       graph.summary(), lexicon.summary(), config.seed);
}

std::string Session::showBrain() const {
    std::string out = fmt::format("Brain: {}\nNode types:\n", graph.summary());
    for (auto c : kAllCategories) out += fmt::format("  {}: {}\n", categoryName(c), graph.membersOf(c).size());
    out += "Edge types:";
    for (auto t : kAllEdgeTypes) {
        auto count = std::count_if(graph.getEdges().begin(), graph.getEdges().end(),
                                   [t](const Edge& e) { return e.type == t; });
        if (count > 0) out += fmt::format("\n  {}: {}", edgeTypeName(t), count);
    }
    return out;
}

std::string Session::profile() const {
    std::string mods;
    for (const auto& kv : modulators) {
        if (!mods.empty()) mods += ", ";
        mods += fmt::format("{}={:.2f}", kv.first, kv.second);
    }
    return fmt::format("Turns: {}\nMemory episodes: {}\nSeed: {}\nModulators: {}",
                       turns, memory.episodes().size(), config.seed, mods);
}

void Session::setSeed(unsigned int seed) {
    config.seed = seed;
    random.reseed(seed);
}

} // namespace NeuroFlow
