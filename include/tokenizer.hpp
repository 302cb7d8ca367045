#pragma once
#include "separators.hpp"

#include <stdexcept>
#include <string>

struct Run {
    std::string text;
    bool separator = false;
};

class Tokenizer {
public:
    Tokenizer(const std::string& text, const SeparatorSet& separators)
        : text_(text), separators_(separators)
    {
    }

    Tokenizer(std::string&&, const SeparatorSet&) = delete;

    // Maximal run of same-class characters starting at start.
    static Run nextRun(const std::string& text, std::size_t start, const SeparatorSet& separators)
    {
        if (start >= text.size()) {
            throw std::out_of_range("Run start " + std::to_string(start) +
                                    " is outside text of length " + std::to_string(text.size()));
        }

        bool sep = separators.isSeparator(text[start]);
        std::size_t end = start + 1;
        while (end < text.size() && separators.isSeparator(text[end]) == sep) {
            ++end;
        }
        return {text.substr(start, end - start), sep};
    }

    bool hasNext() const { return pos_ < text_.size(); }

    Run next()
    {
        if (!hasNext()) {
            throw std::out_of_range("Tokenizer is exhausted");
        }
        Run run = nextRun(text_, pos_, separators_);
        pos_ += run.text.size();
        return run;
    }

    void reset() { pos_ = 0; }

    std::size_t position() const { return pos_; }

private:
    const std::string& text_;
    const SeparatorSet& separators_;
    std::size_t pos_ = 0;
};
