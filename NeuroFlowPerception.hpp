// NeuroFlow perception
//
// Maps raw user text to a concept -> activation injection: normalization,
// longest-first phrase detection, tokenization, synonym and stopword handling.
#pragma once
#include "NeuroFlowDynamics.hpp"
#include "NeuroFlowLexicon.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace NeuroFlow {

struct PerceptionResult {
    std::string rawInput;
    std::vector<std::string> tokens;
    std::vector<std::pair<std::string, std::vector<NodeId>>> matchedPhrases;
    std::vector<std::pair<std::string, std::vector<NodeId>>> matchedWords;
    ActivationMap activatedConcepts;
    std::map<std::string, std::string> synonymMappings;
    std::vector<std::string> removedStopwords;
};

class InputProcessor {
public:
    static constexpr double kPhraseActivation = 0.8;
    static constexpr double kWordActivation = 0.7;

    explicit InputProcessor(const Lexicon& lexicon)
        : lexicon(lexicon), phrasesByLength(lexicon.sortedPhrases()) {}

    PerceptionResult process(const std::string& rawInput) const;

private:
    const Lexicon& lexicon;
    std::vector<std::string> phrasesByLength;
};

// Lower-cased, trimmed, with everything but alphanumerics, '_' and whitespace removed
std::string normalizeText(const std::string& raw);

} // namespace NeuroFlow
