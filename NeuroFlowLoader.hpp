// NeuroFlow loaders
//
// Graph definitions come either as '|'-separated line records
// (N|id|category|label|baseline|decay|threshold, E|source|target|type|weight)
// or as JSON ({"nodes":[...], "edges":[...]}). Both loaders keep going past a
// bad record, collect one diagnostic per failure and refuse the graph with a
// single LoadError if anything failed.
#pragma once
#include "NeuroFlowGraph.hpp"
#include <istream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace NeuroFlow {

class LoadError : public std::runtime_error {
public:
    LoadError(const std::string& heading, std::vector<std::string> problems);
    const std::vector<std::string>& problems() const { return lines; }

private:
    std::vector<std::string> lines;
};

// Record helpers shared by the graph and lexicon loaders
std::string trim(const std::string& s);
std::string toLower(std::string s);
std::vector<std::string> splitFields(const std::string& line, char sep);
double parseNumber(const std::string& field);

Graph loadGraphRecords(std::istream& in);
Graph loadGraphFromJson(const nlohmann::json& json);
// Dispatches on the ".json" extension
Graph loadGraph(const std::string& path);

} // namespace NeuroFlow
