#pragma once
#include "config.hpp"
#include "ranker.hpp"
#include "renderer.hpp"
#include "separators.hpp"
#include "word_counter.hpp"

#include <limits>
#include <stdexcept>
#include <string>

struct TagCloudResult {
    std::string html;
    std::size_t shownCount = 0;
    std::size_t distinctWords = 0;
    int minCount = 0;
    int maxCount = 0;
};

class TagCloud {
public:
    static TagCloudResult generate(const std::string& text,
                                   const std::string& title,
                                   int requestedCount,
                                   const SeparatorSet& separators = SeparatorSet::defaults(),
                                   const RenderOptions& options = RenderOptions())
    {
        if (requestedCount < 0) {
            throw InvalidCountError(requestedCount);
        }

        FrequencyTable freq = WordCounter::countWords(text, separators);
        SelectedSubset subset = Ranker::select(freq, requestedCount);

        TagCloudResult result;
        result.distinctWords = freq.size();
        result.shownCount = subset.size();
        result.minCount = subset.minCount;
        result.maxCount = subset.maxCount;
        result.html = Renderer::render(subset, title, subset.size(), options);
        return result;
    }

    // Parses a user-supplied word count; surrounding whitespace is allowed.
    static int parseCount(const std::string& raw)
    {
        std::string s = Config::trim(raw);
        if (s.empty()) {
            throw std::invalid_argument("Word count is empty");
        }

        std::size_t used = 0;
        long long value = 0;
        try {
            value = std::stoll(s, &used);
        } catch (const std::invalid_argument&) {
            throw std::invalid_argument("Word count is not a number: " + s);
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("Word count is out of range: " + s);
        }
        if (used != s.size()) {
            throw std::invalid_argument("Word count is not a number: " + s);
        }
        if (value < 0) {
            throw InvalidCountError(value);
        }
        if (value > std::numeric_limits<int>::max()) {
            throw std::invalid_argument("Word count is out of range: " + s);
        }
        return static_cast<int>(value);
    }

    static SeparatorSet separatorsFrom(const Config& cfg)
    {
        std::string alphabet = Config::unescape(cfg.get("tokenizer.separators"));
        return alphabet.empty() ? SeparatorSet() : SeparatorSet(alphabet);
    }

    static RenderOptions renderOptionsFrom(const Config& cfg)
    {
        RenderOptions options;
        options.stylesheet = cfg.get("render.stylesheet", kDefaultStylesheet);
        options.inlineStyle = cfg.getBool("render.inline_style", false);
        options.escapeMarkup = cfg.getBool("render.escape_html", true);
        return options;
    }
};
