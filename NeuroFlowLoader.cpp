// NeuroFlowLoader.cpp
//
// Line-record and JSON graph loaders. Nodes are inserted as they are read;
// edges are deferred until every node is known so declaration order in the
// file does not matter.
#include "NeuroFlowLoader.hpp"
#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <fstream>
#include <tuple>

namespace NeuroFlow {

LoadError::LoadError(const std::string& heading, std::vector<std::string> problems)
    : std::runtime_error([&] {
          std::string msg = heading;
          for (const auto& p : problems) { msg += "\n"; msg += p; }
          return msg;
      }()),
      lines(std::move(problems)) {}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> splitFields(const std::string& line, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(sep, start);
        if (pos == std::string::npos) { out.push_back(line.substr(start)); break; }
        out.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

double parseNumber(const std::string& field) {
    std::string s = trim(field);
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(s, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (s.empty() || used != s.size()) {
        throw std::invalid_argument(fmt::format("could not convert string to float: '{}'", s));
    }
    return v;
}

Graph loadGraphRecords(std::istream& in) {
    Graph graph;
    std::vector<std::string> errors;
    // line number, source, target, type name, weight
    std::vector<std::tuple<int, std::string, std::string, std::string, double>> pendingEdges;

    std::string raw;
    int lineNum = 0;
    while (std::getline(in, raw)) {
        ++lineNum;
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') continue;
        auto parts = splitFields(line, '|');
        std::string recordType = trim(parts[0]);
        try {
            if (recordType == "N") {
                if (parts.size() < 7) {
                    errors.push_back(fmt::format("Line {}: NODE record needs 7 fields, got {}", lineNum, parts.size()));
                    continue;
                }
                Node node(trim(parts[1]), parseCategory(trim(parts[2])), trim(parts[3]),
                          parseNumber(parts[4]), parseNumber(parts[5]), parseNumber(parts[6]));
                graph.addNode(std::move(node));
            } else if (recordType == "E") {
                if (parts.size() < 5) {
                    errors.push_back(fmt::format("Line {}: EDGE record needs 5 fields, got {}", lineNum, parts.size()));
                    continue;
                }
                pendingEdges.emplace_back(lineNum, trim(parts[1]), trim(parts[2]), trim(parts[3]), parseNumber(parts[4]));
            } else {
                errors.push_back(fmt::format("Line {}: Unknown record type '{}'", lineNum, recordType));
            }
        } catch (const std::exception& e) {
            errors.push_back(fmt::format("Line {}: Parse error: {}", lineNum, e.what()));
        }
    }

    for (const auto& pe : pendingEdges) {
        try {
            graph.addEdge(Edge(std::get<1>(pe), std::get<2>(pe), parseEdgeType(std::get<3>(pe)), std::get<4>(pe)));
        } catch (const std::exception& e) {
            errors.push_back(fmt::format("Line {}: Edge error: {}", std::get<0>(pe), e.what()));
        }
    }

    auto problems = graph.validate();
    errors.insert(errors.end(), problems.begin(), problems.end());
    if (!errors.empty()) throw LoadError("Graph validation errors:", std::move(errors));
    return graph;
}

// Load a graph from JSON: {"nodes":[{id,type,label,baseline,decay,threshold,metadata}],
// "edges":[{source,target,type,weight}]}
Graph loadGraphFromJson(const nlohmann::json& json) {
    Graph graph;
    std::vector<std::string> errors;

    if (json.contains("nodes") && json["nodes"].is_array()) {
        size_t i = 0;
        for (const auto& nodeJson : json["nodes"]) {
            try {
                Node node(nodeJson.at("id").get<std::string>(),
                          parseCategory(nodeJson.at("type").get<std::string>()),
                          nodeJson.value("label", nodeJson.at("id").get<std::string>()),
                          nodeJson.value("baseline", 0.0),
                          nodeJson.value("decay", 0.05),
                          nodeJson.value("threshold", 0.3));
                if (nodeJson.contains("metadata") && nodeJson["metadata"].is_object()) {
                    for (const auto& m : nodeJson["metadata"].items()) {
                        // Keep strings as-is; other scalars keep their JSON spelling
                        node.metadata[m.key()] = m.value().is_string() ? m.value().get<std::string>() : m.value().dump();
                    }
                }
                graph.addNode(std::move(node));
            } catch (const std::exception& e) {
                errors.push_back(fmt::format("Node #{}: {}", i, e.what()));
            }
            ++i;
        }
    }

    if (json.contains("edges") && json["edges"].is_array()) {
        size_t i = 0;
        for (const auto& edgeJson : json["edges"]) {
            try {
                graph.addEdge(Edge(edgeJson.at("source").get<std::string>(),
                                   edgeJson.at("target").get<std::string>(),
                                   parseEdgeType(edgeJson.at("type").get<std::string>()),
                                   edgeJson.value("weight", 0.5)));
            } catch (const std::exception& e) {
                errors.push_back(fmt::format("Edge #{}: {}", i, e.what()));
            }
            ++i;
        }
    }

    auto problems = graph.validate();
    errors.insert(errors.end(), problems.begin(), problems.end());
    if (!errors.empty()) throw LoadError("Graph validation errors:", std::move(errors));
    return graph;
}

Graph loadGraph(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) throw std::runtime_error("Could not find graph file: " + path);
    auto dot = path.rfind('.');
    if (dot != std::string::npos && toLower(path.substr(dot)) == ".json") {
        nlohmann::json json;
        f >> json;
        return loadGraphFromJson(json);
    }
    return loadGraphRecords(f);
}

} // namespace NeuroFlow
