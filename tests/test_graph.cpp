#include "NeuroFlowGraph.hpp"
#include <cassert>
#include <iostream>
#include <string>

using namespace NeuroFlow;

void test_node_defaults() {
    std::cout << "Testing Node defaults..." << std::endl;

    Node n("c_lake", Category::Concept, "Lake");
    assert(n.activation == 0.0);
    assert(n.decay == 0.05);
    assert(n.threshold == 0.3);
    assert(!n.isFiring());

    n.activation = 0.3;
    assert(n.isFiring());
    n.activation = 1.7;
    n.clamp();
    assert(n.activation == 1.0);
    n.activation = -0.2;
    n.clamp();
    assert(n.activation == 0.0);

    Node b("e_calm", Category::Emotion, "Calm", 0.2);
    assert(b.activation == 0.2);
    b.activation = 0.9;
    b.reset();
    assert(b.activation == 0.2);

    std::cout << "  PASS" << std::endl;
}

void test_names() {
    std::cout << "Testing category/edge type names..." << std::endl;

    for (auto c : kAllCategories) assert(parseCategory(categoryName(c)) == c);
    for (auto t : kAllEdgeTypes) assert(parseEdgeType(edgeTypeName(t)) == t);

    bool threw = false;
    try {
        parseCategory("feeling");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        parseEdgeType("Excitatory");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_add_and_lookup() {
    std::cout << "Testing Graph add/lookup..." << std::endl;

    Graph g;
    g.addNode(Node("c_a", Category::Concept, "A"));
    g.addNode(Node("t_b", Category::Topic, "B"));
    g.addNode(Node("c_c", Category::Concept, "C"));
    g.addEdge(Edge("c_a", "t_b", EdgeType::Excitatory, 0.6));
    g.addEdge(Edge("c_a", "c_c", EdgeType::Associative, 0.4));
    g.addEdge(Edge("t_b", "c_c", EdgeType::Inhibitory, -0.3));

    assert(g.nodeCount() == 3);
    assert(g.edgeCount() == 3);
    assert(g.indexOf("t_b") == 1);
    assert(g.indexOf("nope") == -1);
    assert(g.findNode("c_c") != nullptr);
    assert(g.findNode("nope") == nullptr);

    auto concepts = g.nodesByCategory(Category::Concept);
    assert(concepts.size() == 2);
    assert(concepts[0]->id == "c_a");
    assert(concepts[1]->id == "c_c");
    assert(g.nodesByCategory(Category::Goal).empty());

    const auto& out = g.outgoing("c_a");
    assert(out.size() == 2);
    assert(g.edge(out[0]).targetId == "t_b");
    assert(g.edge(out[1]).targetId == "c_c");
    const auto& in = g.incoming("c_c");
    assert(in.size() == 2);
    assert(g.edge(in[0]).sourceId == "c_a");
    assert(g.edge(in[1]).sourceId == "t_b");
    assert(g.outgoing("nope").empty());
    assert(g.incoming("nope").empty());

    assert(g.edge(0).source == 0);
    assert(g.edge(0).target == 1);
    assert(g.summary() == "3 nodes, 3 edges");

    std::cout << "  PASS" << std::endl;
}

void test_duplicate_node() {
    std::cout << "Testing duplicate node id..." << std::endl;

    Graph g;
    g.addNode(Node("c_a", Category::Concept, "A"));
    bool threw = false;
    try {
        g.addNode(Node("c_a", Category::Topic, "Again"));
    } catch (const DuplicateIdentifier& e) {
        threw = true;
        assert(e.id == "c_a");
        assert(std::string(e.what()).find("c_a") != std::string::npos);
    }
    assert(threw);
    assert(g.nodeCount() == 1);
    assert(g.findNode("c_a")->category == Category::Concept);

    std::cout << "  PASS" << std::endl;
}

void test_dangling_edge() {
    std::cout << "Testing dangling edge references..." << std::endl;

    Graph g;
    g.addNode(Node("c_a", Category::Concept, "A"));

    bool threw = false;
    try {
        g.addEdge(Edge("c_missing", "c_a", EdgeType::Excitatory, 0.5));
    } catch (const DanglingReference& e) {
        threw = true;
        assert(e.id == "c_missing");
        assert(std::string(e.what()).find("source") != std::string::npos);
    }
    assert(threw);

    threw = false;
    try {
        g.addEdge(Edge("c_a", "c_missing", EdgeType::Excitatory, 0.5));
    } catch (const DanglingReference& e) {
        threw = true;
        assert(std::string(e.what()).find("target") != std::string::npos);
    }
    assert(threw);
    assert(g.edgeCount() == 0);
    assert(g.outgoing("c_a").empty());

    std::cout << "  PASS" << std::endl;
}

void test_weight_range() {
    std::cout << "Testing edge weight range..." << std::endl;

    Graph g;
    g.addNode(Node("c_a", Category::Concept, "A"));
    g.addNode(Node("c_b", Category::Concept, "B"));
    g.addEdge(Edge("c_a", "c_b", EdgeType::Excitatory, 1.0));
    g.addEdge(Edge("c_b", "c_a", EdgeType::Inhibitory, -1.0));

    bool threw = false;
    try {
        g.addEdge(Edge("c_a", "c_b", EdgeType::Excitatory, 1.5));
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
    assert(g.edgeCount() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_validate() {
    std::cout << "Testing structural validation..." << std::endl;

    Graph noGoal;
    noGoal.addNode(Node("c_only", Category::Concept, "Only"));
    auto problems = noGoal.validate();
    assert(problems.size() == 1);
    assert(problems[0] == "No goal nodes defined in graph");

    Graph ok;
    ok.addNode(Node("c_a", Category::Concept, "A"));
    ok.addNode(Node("goal_inform", Category::Goal, "Inform"));
    ok.addEdge(Edge("c_a", "goal_inform", EdgeType::Excitatory, 0.5));
    assert(ok.validate().empty());

    Graph empty;
    assert(empty.validate().size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_resets() {
    std::cout << "Testing activation/contribution resets..." << std::endl;

    Graph g;
    g.addNode(Node("c_a", Category::Concept, "A", 0.1));
    g.addNode(Node("c_b", Category::Concept, "B"));
    g.addEdge(Edge("c_a", "c_b", EdgeType::Excitatory, 0.5));
    g.findNode("c_a")->activation = 0.9;
    g.findNode("c_b")->activation = 0.7;
    g.edge(0).contribution = 2.5;

    g.resetActivations();
    assert(g.findNode("c_a")->activation == 0.1);
    assert(g.findNode("c_b")->activation == 0.0);
    g.resetContributions();
    assert(g.edge(0).contribution == 0.0);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== NeuroFlow Graph Tests ===" << std::endl;

    test_node_defaults();
    test_names();
    test_add_and_lookup();
    test_duplicate_node();
    test_dangling_edge();
    test_weight_range();
    test_validate();
    test_resets();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
