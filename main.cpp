// main.cpp
//
// NeuroFlow front end. Parses the CLI (CLI11, optional config file), loads the
// graph and lexicon, then either:
// - runs the given --input turns once and exits,
// - runs a compute-only benchmark writing NDJSON perf summaries, or
// - starts the interactive shell (exit, debug, showbrain, profile, seed <n>).
#include "NeuroFlowSession.hpp"
#include <CLI/CLI.hpp>
#include <cctype>
#include <cstdio>
#include <fmt/core.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

namespace {

void printTurn(const NeuroFlow::Session& session, const NeuroFlow::TurnResult& turn) {
    fmt::print("\nBot: {}\n", turn.response);
    fmt::print("{}\n", turn.trace.formatCompact());
    if (session.debugMode) {
        fmt::print("{}\n", turn.trace.formatFull());
        fmt::print(stderr, "[debug] goal={} candidates={} words={} recent={}\n", turn.trace.selectedGoal,
                   turn.trace.languageCandidates.size(), turn.trace.finalWords.size(), session.getRecentWords().size());
    }
    fmt::print("  [{:.1f}ms]\n\n", turn.elapsedMs);
}

// Shell commands; returns false when the shell should exit
bool handleCommand(NeuroFlow::Session& session, const std::string& line, std::ofstream* traceOut) {
    std::string cmd = line;
    for (auto& c : cmd) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (cmd == "exit") {
        fmt::print("Goodbye!\n");
        return false;
    }
    if (cmd == "debug") {
        session.debugMode = !session.debugMode;
        fmt::print("Debug mode: {}\n", session.debugMode ? "ON" : "OFF");
        return true;
    }
    if (cmd == "showbrain") {
        fmt::print("{}\n", session.showBrain());
        return true;
    }
    if (cmd == "profile") {
        fmt::print("{}\n", session.profile());
        return true;
    }
    if (cmd.rfind("seed ", 0) == 0) {
        std::istringstream args(cmd.substr(5));
        long long seed = 0;
        if (args >> seed && seed >= 0) {
            session.setSeed(static_cast<unsigned int>(seed));
            fmt::print("Seed set to {}\n", seed);
        } else {
            fmt::print("Usage: seed <number>\n");
        }
        return true;
    }

    auto turn = session.processInput(line);
    printTurn(session, turn);
    if (traceOut) *traceOut << turn.trace.toJson().dump() << "\n";
    return true;
}

} // namespace

int main(int argc, char** argv) {
    NeuroFlow::SessionConfig config;
    double curiosity = config.modulators["curiosity"];
    double calm = config.modulators["calm"];
    double urgency = config.modulators["urgency"];
    bool noCompetition = false;
    bool debug = false;
    std::vector<std::string> inputs;
    std::string traceJsonPath;
    int bench = 0;                 // turns to run in compute-only benchmark mode
    std::string perfOut;           // NDJSON file
    int perfEvery = 100;           // turns per perf summary

    CLI::App app{"NeuroFlow"};
    try {
        app.add_option("--graph", config.graphPath, "Path to graph definition (.brain records or .json)");
        app.add_option("--lexicon", config.lexiconPath, "Path to lexicon records (.brain)");
        app.add_option("--seed", config.seed, "Random seed for word selection tie-breaks");
        app.add_option("--steps", config.dynamics.steps, "Simulation steps per turn")->check(CLI::NonNegativeNumber);
        app.add_option("--inhibition", config.dynamics.inhibitionStrength, "Same-category inhibition strength");
        app.add_flag("--no-competition", noCompetition, "Disable same-category competition");
        app.add_option("--max-words", config.motor.maxWords, "Maximum words per response")->check(CLI::NonNegativeNumber);
        app.add_option("--curiosity", curiosity, "Initial curiosity modulator")->check(CLI::Range(0.0, 1.0));
        app.add_option("--calm", calm, "Initial calm modulator")->check(CLI::Range(0.0, 1.0));
        app.add_option("--urgency", urgency, "Initial urgency modulator")->check(CLI::Range(0.0, 1.0));
        app.add_flag("--debug", debug, "Print the full trace after every turn");
        app.add_option("--input", inputs, "Run these turns and exit (repeatable)");
        app.add_option("--trace-json", traceJsonPath, "Append one JSON trace per turn (NDJSON)");
        // Bench/perf
        app.add_option("--bench", bench, "Compute-only benchmark: run N turns of the first --input");
        app.add_option("--perf-out", perfOut, "Write NDJSON perf summaries to file");
        app.add_option("--perf-every", perfEvery, "Turns per perf summary")->check(CLI::PositiveNumber);
        app.allow_extras(false);
        app.set_config("--config", "", "Read options from an INI/TOML file");
        app.set_help_all_flag("--help-all", "Show all help");
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }
    config.dynamics.competitionWithinCategory = !noCompetition;
    config.modulators["curiosity"] = curiosity;
    config.modulators["calm"] = calm;
    config.modulators["urgency"] = urgency;

    std::unique_ptr<NeuroFlow::Session> session;
    try {
        session = std::make_unique<NeuroFlow::Session>(config);
    } catch (const std::exception& e) {
        fmt::print(stderr, "ERROR loading data files:\n{}\n", e.what());
        return 1;
    }
    session->debugMode = debug;

    std::unique_ptr<std::ofstream> traceOut;
    if (!traceJsonPath.empty()) {
        try {
            traceOut = NeuroFlow::openNdjsonOutput(traceJsonPath, true);
        } catch (const std::exception& e) {
            fmt::print(stderr, "[neuroflow] trace: {}\n", e.what());
            return 1;
        }
    }

    // Bench compute-only mode: same input every turn; perf summaries as NDJSON
    if (bench > 0) {
        std::string text = inputs.empty() ? std::string("hello") : inputs.front();
        std::unique_ptr<std::ofstream> perfFile;
        if (!perfOut.empty()) {
            try {
                perfFile = NeuroFlow::openNdjsonOutput(perfOut, false);
            } catch (const std::exception& e) {
                fmt::print(stderr, "[neuroflow] perf: {}\n", e.what());
                return 1;
            }
        }
        double turnMsAccum = 0.0;
        int sinceFlush = 0;
        auto flushPerf = [&]() {
            auto ps = session->getDynamics().getAndResetPerfStats();
            nlohmann::json line = {
                {"type", "perf"},
                {"turns", sinceFlush},
                {"turnMsAccum", turnMsAccum},
                {"dynamicsRuns", ps.runCount},
                {"stepsEvaluated", ps.stepsEvaluated},
                {"edgesEvaluated", ps.edgesEvaluated},
                {"runTimeNsAccum", ps.runTimeNsAccum},
                {"runTimeNsMin", ps.runCount ? ps.runTimeNsMin : 0ull},
                {"runTimeNsMax", ps.runTimeNsMax},
            };
            if (perfFile) *perfFile << line.dump() << "\n" << std::flush;
            else fmt::print("{}\n", line.dump());
            turnMsAccum = 0.0;
            sinceFlush = 0;
        };
        for (int i = 0; i < bench; ++i) {
            auto turn = session->processInput(text);
            turnMsAccum += turn.elapsedMs;
            ++sinceFlush;
            if (sinceFlush >= perfEvery) flushPerf();
        }
        if (sinceFlush > 0) flushPerf();
        return 0;
    }

    if (!inputs.empty()) {
        for (const auto& text : inputs) {
            auto turn = session->processInput(text);
            printTurn(*session, turn);
            if (traceOut) *traceOut << turn.trace.toJson().dump() << "\n";
        }
        return 0;
    }

    fmt::print("{}\n\n", session->startupSummary());
    std::string line;
    while (true) {
        fmt::print("You: ");
        std::fflush(stdout);
        if (!std::getline(std::cin, line)) {
            fmt::print("\nGoodbye!\n");
            break;
        }
        auto begin = line.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) continue;
        line = line.substr(begin, line.find_last_not_of(" \t\r\n") - begin + 1);
        if (!handleCommand(*session, line, traceOut.get())) break;
    }
    return 0;
}
