#pragma once
#include <algorithm>

class FontScaler {
public:
    static constexpr int kMinFont = 11;
    static constexpr int kMaxFont = 48;

    // Linear map of [minCount, maxCount] onto [kMinFont, kMaxFont], rounding down.
    static int fontSize(int count, int minCount, int maxCount)
    {
        if (maxCount <= minCount) return kMinFont;

        count = std::clamp(count, minCount, maxCount);
        long long numerator = static_cast<long long>(kMaxFont - kMinFont) * (count - minCount);
        long long denominator = static_cast<long long>(maxCount) - minCount;
        return static_cast<int>(numerator / denominator) + kMinFont;
    }
};
