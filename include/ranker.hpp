#pragma once
#include "word_counter.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

class InvalidCountError : public std::invalid_argument {
public:
    explicit InvalidCountError(long long count)
        : std::invalid_argument("Word count must be non-negative, got " + std::to_string(count)),
          count_(count)
    {
    }

    long long count() const { return count_; }

private:
    long long count_;
};

struct RankedEntry {
    std::string word;
    int count = 0;
};

struct SelectedSubset {
    std::vector<RankedEntry> entries;
    int minCount = 0;
    int maxCount = 0;

    bool empty() const { return entries.empty(); }
    std::size_t size() const { return entries.size(); }
};

class Ranker {
public:
    static int compareIgnoreCase(const std::string& a, const std::string& b)
    {
        std::size_t n = std::min(a.size(), b.size());
        for (std::size_t i = 0; i < n; ++i) {
            int ca = std::tolower(static_cast<unsigned char>(a[i]));
            int cb = std::tolower(static_cast<unsigned char>(b[i]));
            if (ca != cb) return ca - cb;
        }
        if (a.size() == b.size()) return 0;
        return a.size() < b.size() ? -1 : 1;
    }

    // Top n entries by count (equal counts ordered alphabetically), returned in
    // alphabetical order with min/max counts taken over the selection only.
    static SelectedSubset select(const FrequencyTable& table, int n)
    {
        if (n < 0) {
            throw InvalidCountError(n);
        }

        std::size_t take = std::min(static_cast<std::size_t>(n), table.size());

        std::vector<RankedEntry> ranked;
        ranked.reserve(table.size());
        for (const auto& [word, count] : table) {
            ranked.push_back({word, count});
        }

        auto byCount = [](const RankedEntry& a, const RankedEntry& b) {
            if (a.count != b.count) return a.count > b.count;
            int cmp = compareIgnoreCase(a.word, b.word);
            if (cmp != 0) return cmp < 0;
            return a.word < b.word;
        };
        std::partial_sort(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(take), ranked.end(), byCount);
        ranked.resize(take);

        SelectedSubset subset;
        if (take == 0) return subset;

        subset.maxCount = ranked.front().count;
        subset.minCount = ranked.back().count;

        std::sort(ranked.begin(), ranked.end(), [](const RankedEntry& a, const RankedEntry& b) {
            int cmp = compareIgnoreCase(a.word, b.word);
            if (cmp != 0) return cmp < 0;
            return a.word < b.word;
        });
        subset.entries = std::move(ranked);
        return subset;
    }
};
