// NeuroFlowLexicon.cpp
#include "NeuroFlowLexicon.hpp"
#include "NeuroFlowLoader.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <fstream>

namespace NeuroFlow {

namespace {
const std::vector<std::string> kNoWords;
}

void Lexicon::addWord(LexiconEntry entry) {
    for (const auto& cid : entry.conceptIds) conceptToWords[cid].push_back(entry.text);
    std::string key = entry.text;
    words[key] = std::move(entry);
}

void Lexicon::addPhrase(LexiconEntry entry) {
    for (const auto& cid : entry.conceptIds) conceptToWords[cid].push_back(entry.text);
    if (!phrases.count(entry.text)) phraseOrder.push_back(entry.text);
    std::string key = entry.text;
    phrases[key] = std::move(entry);
}

void Lexicon::addSynonym(const std::string& synonym, const std::string& canonical) {
    synonyms[synonym] = canonical;
}

void Lexicon::addStopword(const std::string& word) {
    stopwords.insert(word);
}

std::string Lexicon::resolve(const std::string& word) const {
    auto it = synonyms.find(word);
    return it == synonyms.end() ? word : it->second;
}

const LexiconEntry* Lexicon::lookupWord(const std::string& word) const {
    auto it = words.find(word);
    return it == words.end() ? nullptr : &it->second;
}

const LexiconEntry* Lexicon::lookupPhrase(const std::string& phrase) const {
    auto it = phrases.find(phrase);
    return it == phrases.end() ? nullptr : &it->second;
}

std::vector<std::string> Lexicon::sortedPhrases() const {
    std::vector<std::string> out = phraseOrder;
    std::stable_sort(out.begin(), out.end(),
                     [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
    return out;
}

const std::vector<std::string>& Lexicon::wordsForConcept(const NodeId& id) const {
    auto it = conceptToWords.find(id);
    return it == conceptToWords.end() ? kNoWords : it->second;
}

std::optional<VocabEntry> Lexicon::lookup(const std::string& form) const {
    const LexiconEntry* e = lookupWord(form);
    if (!e) e = lookupPhrase(form);
    if (!e) return std::nullopt;
    return VocabEntry{e->conceptIds, e->pos};
}

std::string Lexicon::summary() const {
    return fmt::format("{} entries", words.size() + phrases.size());
}

namespace {

std::vector<NodeId> parseConceptList(const std::string& field) {
    std::vector<NodeId> out;
    for (const auto& c : splitFields(trim(field), ',')) {
        std::string id = trim(c);
        if (!id.empty()) out.push_back(id);
    }
    return out;
}

} // namespace

Lexicon loadLexicon(std::istream& in) {
    Lexicon lexicon;
    std::vector<std::string> errors;

    std::string raw;
    int lineNum = 0;
    while (std::getline(in, raw)) {
        ++lineNum;
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') continue;
        auto parts = splitFields(line, '|');
        std::string recordType = trim(parts[0]);

        if (recordType == "WORD" || recordType == "PHRASE") {
            if (parts.size() < 5) {
                errors.push_back(fmt::format("Line {}: {} record needs 5 fields, got {}", lineNum, recordType, parts.size()));
                continue;
            }
            LexiconEntry entry{trim(parts[1]), toLower(trim(parts[2])), parseConceptList(parts[3]), trim(parts[4])};
            if (recordType == "WORD") lexicon.addWord(std::move(entry));
            else lexicon.addPhrase(std::move(entry));
        } else if (recordType == "SYNONYM") {
            if (parts.size() < 3) {
                errors.push_back(fmt::format("Line {}: SYNONYM record needs 3 fields, got {}", lineNum, parts.size()));
                continue;
            }
            lexicon.addSynonym(toLower(trim(parts[1])), toLower(trim(parts[2])));
        } else if (recordType == "STOP") {
            if (parts.size() < 2) {
                errors.push_back(fmt::format("Line {}: STOP record needs 2 fields, got {}", lineNum, parts.size()));
                continue;
            }
            lexicon.addStopword(toLower(trim(parts[1])));
        } else {
            errors.push_back(fmt::format("Line {}: Unknown record type '{}'", lineNum, recordType));
        }
    }

    if (!errors.empty()) throw LoadError("Lexicon validation errors:", std::move(errors));
    return lexicon;
}

Lexicon loadLexicon(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) throw std::runtime_error("Could not find lexicon file: " + path);
    return loadLexicon(f);
}

} // namespace NeuroFlow
