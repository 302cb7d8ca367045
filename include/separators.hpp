#pragma once
#include <bitset>
#include <climits>
#include <string>

// Characters that delimit words: whitespace and common punctuation.
inline const std::string kDefaultSeparators = " \t\n\r,.:;!?/-~()[]*'_{}`\"";

class SeparatorSet {
public:
    explicit SeparatorSet(const std::string& alphabet = kDefaultSeparators)
    {
        for (unsigned char ch : alphabet) {
            bits_.set(ch);
        }
    }

    static const SeparatorSet& defaults()
    {
        static const SeparatorSet set;
        return set;
    }

    bool isSeparator(char ch) const
    {
        return bits_.test(static_cast<unsigned char>(ch));
    }

    std::size_t size() const { return bits_.count(); }

private:
    std::bitset<UCHAR_MAX + 1> bits_;
};
