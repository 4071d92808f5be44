#include "NeuroFlowGoals.hpp"
#include "NeuroFlowMotor.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <map>

using namespace NeuroFlow;

// In-memory vocabulary: concept id -> forms, form -> part of speech
class StubVocabulary : public Vocabulary {
public:
    void add(const NodeId& conceptId, const std::string& form, const std::string& pos) {
        forms[conceptId].push_back(form);
        entries[form] = VocabEntry{{conceptId}, pos};
    }
    const std::vector<std::string>& wordsForConcept(const NodeId& id) const override {
        static const std::vector<std::string> none;
        auto it = forms.find(id);
        return it == forms.end() ? none : it->second;
    }
    std::optional<VocabEntry> lookup(const std::string& form) const override {
        auto it = entries.find(form);
        if (it == entries.end()) return std::nullopt;
        return it->second;
    }

private:
    std::map<NodeId, std::vector<std::string>> forms;
    std::map<std::string, VocabEntry> entries;
};

// Always picks the lowest index of the range
class FirstPick : public RandomSource {
public:
    int uniformInt(int lo, int) override { return lo; }
};

// Always picks the highest index of the range
class LastPick : public RandomSource {
public:
    int uniformInt(int, int hi) override { return hi; }
};

Graph goal_graph() {
    Graph g;
    g.addNode(Node("c_lake", Category::Concept, "Lake"));
    g.addNode(Node("c_snow", Category::Concept, "Snow"));
    g.addNode(Node("e_calm", Category::Emotion, "Calm"));
    g.addNode(Node("m_is", Category::Motor, "Is"));
    g.addNode(Node("goal_describe", Category::Goal, "Describe"));
    g.addNode(Node("goal_inform", Category::Goal, "Inform"));
    g.addEdge(Edge("goal_describe", "c_snow", EdgeType::Associative, 0.5));
    return g;
}

void activate(Graph& g, const NodeId& id, double a) { g.findNode(id)->activation = a; }

const WordCandidate* findWord(const std::vector<WordCandidate>& list, const std::string& word) {
    for (const auto& wc : list) {
        if (wc.word == word) return &wc;
    }
    return nullptr;
}

void test_transitions() {
    std::cout << "Testing part-of-speech transitions..." << std::endl;

    const auto& start = allowedAfter(kStartState);
    assert(start.size() == 7);
    assert(start.front() == "noun");
    const auto& det = allowedAfter("det");
    assert(det.size() == 2);
    assert(det[0] == "noun" && det[1] == "adj");
    const auto& unknown = allowedAfter("particle");
    assert(unknown.size() == 3);
    assert(unknown[0] == "noun" && unknown[1] == "verb" && unknown[2] == "adj");
    assert(posTransitions().size() == 10);

    assert(goalAffinityBoost("goal_greet") == 0.4);
    assert(goalAffinityBoost("goal_clarify") == 0.2);
    assert(goalAffinityBoost("goal_unknown") == 0.1);

    std::cout << "  PASS" << std::endl;
}

void test_fallback() {
    std::cout << "Testing fallback utterance..." << std::endl;

    Graph g = goal_graph();
    StubVocabulary vocab;
    vocab.add("c_lake", "lake", "noun");
    FirstPick rng;

    // Nothing firing
    auto r = generateResponse(g, vocab, "goal_inform", rng, {});
    assert(r.finalText == kFallbackUtterance);
    assert(r.selectedWords.empty());
    assert(r.candidatesConsidered.empty());

    // Firing concept with no lexical forms
    activate(g, "c_snow", 0.9);
    r = generateResponse(g, vocab, "goal_inform", rng, {});
    assert(r.finalText == "i am processing");

    std::cout << "  PASS" << std::endl;
}

void test_scoring() {
    std::cout << "Testing candidate scoring..." << std::endl;

    Graph g = goal_graph();
    activate(g, "c_lake", 0.8);
    activate(g, "c_snow", 0.8);
    activate(g, "e_calm", 0.5);
    activate(g, "m_is", 0.6);
    StubVocabulary vocab;
    vocab.add("c_lake", "lake", "noun");
    vocab.add("c_snow", "snow", "noun");
    vocab.add("e_calm", "calm", "adj");
    vocab.add("m_is", "is", "verb");
    FirstPick rng;

    auto r = generateResponse(g, vocab, "goal_describe", rng, {"lake"});
    const auto* lake = findWord(r.candidatesConsidered, "lake");
    const auto* snow = findWord(r.candidatesConsidered, "snow");
    const auto* calm = findWord(r.candidatesConsidered, "calm");
    const auto* is = findWord(r.candidatesConsidered, "is");
    assert(lake && snow && calm && is);

    // 0.8 * 0.6, repeated word
    assert(std::abs(lake->score - 0.48 * 0.3) < 1e-9);
    // 0.8 * 0.6 + goal affinity 0.3 * |0.5|
    assert(std::abs(snow->score - (0.48 + 0.15)) < 1e-9);
    assert(std::abs(calm->score - 0.3) < 1e-9);
    // Motor candidates: 0.6 * 0.5, no goal boost
    assert(std::abs(is->score - 0.3) < 1e-9);
    assert(is->originId == "m_is");
    assert(r.candidatesConsidered.front().word == "snow");
    for (size_t i = 1; i < r.candidatesConsidered.size(); ++i) {
        assert(r.candidatesConsidered[i - 1].score >= r.candidatesConsidered[i].score);
    }

    // Unknown goal id: no boost
    r = generateResponse(g, vocab, "goal_missing", rng, {});
    snow = findWord(r.candidatesConsidered, "snow");
    assert(std::abs(snow->score - 0.48) < 1e-9);

    std::cout << "  PASS" << std::endl;
}

void test_assembly() {
    std::cout << "Testing grammar-constrained assembly..." << std::endl;

    Graph g;
    g.addNode(Node("c_lake", Category::Concept, "Lake"));
    g.addNode(Node("c_the", Category::Concept, "The"));
    g.addNode(Node("c_run", Category::Concept, "Run"));
    g.addNode(Node("goal_inform", Category::Goal, "Inform"));
    activate(g, "c_the", 0.9);
    activate(g, "c_run", 0.8);
    activate(g, "c_lake", 0.4);
    StubVocabulary vocab;
    vocab.add("c_the", "the", "det");
    vocab.add("c_run", "runs", "verb");
    vocab.add("c_lake", "lake", "noun");
    FirstPick rng;

    // det -> noun (the verb is not allowed after det) -> verb
    auto r = generateResponse(g, vocab, "goal_inform", rng, {});
    assert(r.selectedWords.size() == 3);
    assert(r.finalText == "the lake runs");

    std::cout << "  PASS" << std::endl;
}

void test_no_allowed_fallback() {
    std::cout << "Testing relaxed pick when no candidate fits..." << std::endl;

    Graph g;
    g.addNode(Node("c_a", Category::Concept, "A"));
    g.addNode(Node("c_b", Category::Concept, "B"));
    g.addNode(Node("goal_inform", Category::Goal, "Inform"));
    activate(g, "c_a", 0.9);
    activate(g, "c_b", 0.5);
    StubVocabulary vocab;
    vocab.add("c_a", "the", "det");
    vocab.add("c_b", "an", "det");
    FirstPick rng;

    auto r = generateResponse(g, vocab, "goal_inform", rng, {});
    assert(r.finalText == "the an");

    std::cout << "  PASS" << std::endl;
}

void test_word_limit() {
    std::cout << "Testing word limit..." << std::endl;

    Graph g;
    g.addNode(Node("goal_inform", Category::Goal, "Inform"));
    StubVocabulary vocab;
    for (int i = 0; i < 40; ++i) {
        NodeId id = "c_" + std::to_string(i);
        g.addNode(Node(id, Category::Concept, id));
        activate(g, id, 0.31 + 0.01 * i);
        vocab.add(id, "noun" + std::to_string(i), "noun");
        vocab.add(id, "adj" + std::to_string(i), "adj");
    }
    SeededRandom rng(42);

    auto r = generateResponse(g, vocab, "goal_inform", rng, {});
    assert(r.selectedWords.size() == 15);

    MotorConfig small;
    small.maxWords = 4;
    r = generateResponse(g, vocab, "goal_inform", rng, {}, small);
    assert(r.selectedWords.size() == 4);

    // Only the 25 strongest concept sources produce candidates
    assert(r.candidatesConsidered.size() == 50);

    // No word repeats within one response
    for (size_t i = 0; i < r.selectedWords.size(); ++i) {
        for (size_t j = i + 1; j < r.selectedWords.size(); ++j) {
            assert(r.selectedWords[i].word != r.selectedWords[j].word);
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_recent_window() {
    std::cout << "Testing repetition window..." << std::endl;

    Graph g;
    g.addNode(Node("c_lake", Category::Concept, "Lake"));
    g.addNode(Node("goal_inform", Category::Goal, "Inform"));
    activate(g, "c_lake", 0.8);
    StubVocabulary vocab;
    vocab.add("c_lake", "lake", "noun");
    FirstPick rng;

    std::vector<std::string> recent;
    for (int i = 0; i < 30; ++i) recent.push_back("w" + std::to_string(i));

    // Oldest of 30: outside the last 20, no penalty
    recent[0] = "lake";
    auto r = generateResponse(g, vocab, "goal_inform", rng, recent);
    assert(std::abs(findWord(r.candidatesConsidered, "lake")->score - 0.48) < 1e-9);

    // 21st most recent: still outside
    recent[0] = "w0";
    recent[9] = "lake";
    r = generateResponse(g, vocab, "goal_inform", rng, recent);
    assert(std::abs(findWord(r.candidatesConsidered, "lake")->score - 0.48) < 1e-9);

    // 20th most recent: penalized
    recent[9] = "w9";
    recent[10] = "lake";
    r = generateResponse(g, vocab, "goal_inform", rng, recent);
    assert(std::abs(findWord(r.candidatesConsidered, "lake")->score - 0.48 * 0.3) < 1e-9);

    // A wider window reaches the oldest entry
    recent[10] = "w10";
    recent[0] = "lake";
    MotorConfig wide;
    wide.recentWindow = 30;
    r = generateResponse(g, vocab, "goal_inform", rng, recent, wide);
    assert(std::abs(findWord(r.candidatesConsidered, "lake")->score - 0.48 * 0.3) < 1e-9);

    std::cout << "  PASS" << std::endl;
}

void test_same_origin_halving() {
    std::cout << "Testing same-origin score halving..." << std::endl;

    Graph g;
    g.addNode(Node("c_a", Category::Concept, "A"));
    g.addNode(Node("c_b", Category::Concept, "B"));
    g.addNode(Node("goal_inform", Category::Goal, "Inform"));
    activate(g, "c_a", 0.9);
    activate(g, "c_b", 0.6);
    StubVocabulary vocab;
    vocab.add("c_a", "alpha", "noun");
    vocab.add("c_a", "apex", "noun");
    vocab.add("c_b", "gamma", "noun");
    FirstPick rng;

    // apex starts at 0.54 against gamma at 0.36, but drops to 0.27 once alpha
    // is chosen, which puts it below gamma and outside the second tier
    auto r = generateResponse(g, vocab, "goal_inform", rng, {});
    assert(r.selectedWords.size() == 3);
    assert(r.finalText == "alpha gamma apex");
    assert(std::abs(findWord(r.candidatesConsidered, "apex")->score - 0.54) < 1e-9);

    std::cout << "  PASS" << std::endl;
}

void test_tier_boundary() {
    std::cout << "Testing top-tier cutoff..." << std::endl;

    Graph g;
    g.addNode(Node("c_top", Category::Concept, "Top"));
    g.addNode(Node("c_mid", Category::Concept, "Mid"));
    g.addNode(Node("c_low", Category::Concept, "Low"));
    g.addNode(Node("goal_inform", Category::Goal, "Inform"));
    activate(g, "c_top", 1.0);
    activate(g, "c_mid", 0.86);
    activate(g, "c_low", 0.84);
    StubVocabulary vocab;
    vocab.add("c_top", "top", "noun");
    vocab.add("c_mid", "mid", "noun");
    vocab.add("c_low", "low", "noun");
    LastPick rng;

    // Scores 0.6, 0.516, 0.504 against a cutoff of 0.51: the tier is {top, mid}
    MotorConfig one;
    one.maxWords = 1;
    auto r = generateResponse(g, vocab, "goal_inform", rng, {}, one);
    assert(r.finalText == "mid");

    // low only comes once it is the strongest candidate left
    r = generateResponse(g, vocab, "goal_inform", rng, {});
    assert(r.finalText == "mid top low");

    std::cout << "  PASS" << std::endl;
}

void test_seeded_determinism() {
    std::cout << "Testing seeded generation determinism..." << std::endl;

    Graph g;
    g.addNode(Node("goal_inform", Category::Goal, "Inform"));
    StubVocabulary vocab;
    for (int i = 0; i < 10; ++i) {
        NodeId id = "c_" + std::to_string(i);
        g.addNode(Node(id, Category::Concept, id));
        activate(g, id, 0.8);
        vocab.add(id, "w" + std::to_string(i), "noun");
    }

    SeededRandom a(7), b(7);
    auto r1 = generateResponse(g, vocab, "goal_inform", a, {});
    auto r2 = generateResponse(g, vocab, "goal_inform", b, {});
    assert(r1.finalText == r2.finalText);
    assert(r1.selectedWords.size() == r2.selectedWords.size());

    a.reseed(7);
    auto r3 = generateResponse(g, vocab, "goal_inform", a, {});
    assert(r3.finalText == r1.finalText);

    std::cout << "  PASS" << std::endl;
}

void test_goal_selection() {
    std::cout << "Testing goal arbitration..." << std::endl;

    Graph g = goal_graph();
    activate(g, "goal_describe", 0.4);
    activate(g, "goal_inform", 0.7);
    auto r = selectGoal(g);
    assert(r.selectedGoal.has_value());
    assert(*r.selectedGoal == "goal_inform");
    assert(r.selectedActivation == 0.7);
    assert(r.candidates.size() == 2);
    assert(r.candidates[1].first == "goal_describe");

    // Ties keep insertion order; selection happens even at zero activation
    activate(g, "goal_describe", 0.0);
    activate(g, "goal_inform", 0.0);
    r = selectGoal(g);
    assert(*r.selectedGoal == "goal_describe");

    Graph none;
    none.addNode(Node("c_a", Category::Concept, "A"));
    r = selectGoal(none);
    assert(!r.selectedGoal.has_value());
    assert(r.candidates.empty());

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== NeuroFlow Motor Tests ===" << std::endl;

    test_transitions();
    test_fallback();
    test_scoring();
    test_assembly();
    test_no_allowed_fallback();
    test_word_limit();
    test_recent_window();
    test_same_origin_halving();
    test_tier_boundary();
    test_seeded_determinism();
    test_goal_selection();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
