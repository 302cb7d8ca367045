#pragma once
#include "separators.hpp"
#include "tokenizer.hpp"

#include <cctype>
#include <string>
#include <unordered_map>
#include <utility>

using FrequencyTable = std::unordered_map<std::string, int>;

class WordCounter {
public:
    static std::string toLower(std::string s) {
        for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }

    static FrequencyTable countWords(const std::string& text, const SeparatorSet& separators) {
        FrequencyTable freq;
        Tokenizer tokens(text, separators);

        while (tokens.hasNext()) {
            Run run = tokens.next();
            if (run.separator) continue;
            ++freq[toLower(std::move(run.text))];
        }

        return freq;
    }

    static long long totalWords(const FrequencyTable& freq) {
        long long total = 0;
        for (const auto& [word, count] : freq) {
            total += count;
        }
        return total;
    }
};
