// NeuroFlowPerception.cpp
#include "NeuroFlowPerception.hpp"
#include "NeuroFlowLoader.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace NeuroFlow {

std::string normalizeText(const std::string& raw) {
    std::string text = toLower(trim(raw));
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        // Bytes of multi-byte UTF-8 sequences pass through untouched
        if (c >= 0x80 || std::isalnum(c) || c == '_' || std::isspace(c)) out.push_back(ch);
    }
    return out;
}

PerceptionResult InputProcessor::process(const std::string& rawInput) const {
    PerceptionResult result;
    result.rawInput = rawInput;

    std::string remaining = normalizeText(rawInput);

    // Phrases first, longest first; a matched phrase is blanked out everywhere
    for (const auto& phrase : phrasesByLength) {
        if (remaining.find(phrase) == std::string::npos) continue;
        const LexiconEntry* entry = lexicon.lookupPhrase(phrase);
        if (!entry) continue;
        result.matchedPhrases.emplace_back(phrase, entry->conceptIds);
        for (const auto& cid : entry->conceptIds) result.activatedConcepts[cid] += kPhraseActivation;
        size_t pos = 0;
        while ((pos = remaining.find(phrase, pos)) != std::string::npos) {
            remaining.replace(pos, phrase.size(), " ");
            pos += 1;
        }
    }

    std::istringstream tokens(remaining);
    std::string token;
    while (tokens >> token) {
        std::string canonical = lexicon.resolve(token);
        if (canonical != token) {
            result.synonymMappings[token] = canonical;
            token = canonical;
        }
        if (lexicon.isStopword(token)) {
            result.removedStopwords.push_back(token);
            continue;
        }
        result.tokens.push_back(token);
        if (const LexiconEntry* entry = lexicon.lookupWord(token)) {
            result.matchedWords.emplace_back(token, entry->conceptIds);
            for (const auto& cid : entry->conceptIds) result.activatedConcepts[cid] += kWordActivation;
        }
    }

    for (auto& kv : result.activatedConcepts) kv.second = std::min(1.0, kv.second);
    return result;
}

} // namespace NeuroFlow
