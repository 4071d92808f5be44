// NeuroFlow session
//
// Orchestrates one conversational turn: perception -> memory boost ->
// dynamics -> goal arbitration -> motor generation -> memory store. A Session
// exclusively owns its graph, lexicon and random source; it is driven by one
// thread of control.
#pragma once
#include "NeuroFlowDynamics.hpp"
#include "NeuroFlowGoals.hpp"
#include "NeuroFlowLexicon.hpp"
#include "NeuroFlowMemory.hpp"
#include "NeuroFlowMotor.hpp"
#include "NeuroFlowPerception.hpp"
#include "NeuroFlowTrace.hpp"
#include <memory>
#include <string>
#include <vector>

namespace NeuroFlow {

struct SessionConfig {
    std::string graphPath = "data/graph.brain";
    std::string lexiconPath = "data/lexicon.brain";
    unsigned int seed = 42;
    DynamicsConfig dynamics;
    Modulators modulators = {{"curiosity", 0.5}, {"calm", 0.6}, {"urgency", 0.3}};
    MotorConfig motor;
    size_t recentWordWindow = 30;
    NodeId defaultGoal = "goal_inform";
};

struct TurnResult {
    std::string response;
    Trace trace;
    double elapsedMs = 0.0;
};

class Session {
public:
    // Loads lexicon and graph from the configured paths; throws LoadError or
    // std::runtime_error when either cannot be used.
    explicit Session(SessionConfig config);
    // Takes already-built data (tests, embedding)
    Session(SessionConfig config, Lexicon lexicon, Graph graph);
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    TurnResult processInput(const std::string& userInput);

    std::string startupSummary() const;
    std::string showBrain() const;
    std::string profile() const;
    void setSeed(unsigned int seed);

    bool debugMode = false;

    const Graph& getGraph() const { return graph; }
    const Lexicon& getLexicon() const { return lexicon; }
    const Memory& getMemory() const { return memory; }
    const Modulators& getModulators() const { return modulators; }
    const std::vector<std::string>& getRecentWords() const { return recentWords; }
    unsigned int getSeed() const { return config.seed; }
    int turnCount() const { return turns; }
    DynamicsEngine& getDynamics() { return dynamics; }

private:
    SessionConfig config;
    Lexicon lexicon;
    Graph graph;
    // Holds a reference to lexicon; rebuilt whenever lexicon is replaced
    std::unique_ptr<InputProcessor> perception;
    Memory memory;
    DynamicsEngine dynamics;
    Modulators modulators;
    SeededRandom random;
    std::vector<std::string> recentWords;
    int turns = 0;

    void updateModulators(const PerceptionResult& perceived);
};

} // namespace NeuroFlow
