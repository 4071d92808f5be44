// NeuroFlow lexicon
//
// Words, phrases, synonyms and stopwords, plus the node id -> surface form
// index the motor generator reads through the Vocabulary interface.
#pragma once
#include "NeuroFlowMotor.hpp"
#include <istream>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace NeuroFlow {

struct LexiconEntry {
    std::string id;
    std::string text;
    std::vector<NodeId> conceptIds;
    std::string pos;
};

class Lexicon : public Vocabulary {
public:
    void addWord(LexiconEntry entry);
    void addPhrase(LexiconEntry entry);
    void addSynonym(const std::string& synonym, const std::string& canonical);
    void addStopword(const std::string& word);

    // Canonical form of a synonym, the word itself otherwise
    std::string resolve(const std::string& word) const;
    bool isStopword(const std::string& word) const { return stopwords.count(word) > 0; }

    const LexiconEntry* lookupWord(const std::string& word) const;
    const LexiconEntry* lookupPhrase(const std::string& phrase) const;
    // Phrases longest first, ties in declaration order
    std::vector<std::string> sortedPhrases() const;

    const std::vector<std::string>& wordsForConcept(const NodeId& id) const override;
    std::optional<VocabEntry> lookup(const std::string& form) const override;

    size_t wordCount() const { return words.size(); }
    size_t phraseCount() const { return phrases.size(); }
    std::string summary() const;

private:
    std::unordered_map<std::string, LexiconEntry> words;
    std::unordered_map<std::string, LexiconEntry> phrases;
    std::vector<std::string> phraseOrder;
    std::unordered_map<std::string, std::string> synonyms;
    std::set<std::string> stopwords;
    std::unordered_map<NodeId, std::vector<std::string>> conceptToWords;
};

// Line records: WORD|id|text|c1,c2|pos, PHRASE|id|text|c1,c2|pos,
// SYNONYM|syn|canonical, STOP|word. Throws LoadError listing every bad line.
Lexicon loadLexicon(std::istream& in);
Lexicon loadLexicon(const std::string& path);

} // namespace NeuroFlow
