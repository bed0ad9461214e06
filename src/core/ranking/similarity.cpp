#include "core/ranking/similarity.h"

#include <algorithm>
#include <cstdlib>
#include <vector>

namespace rw {

int Similarity::editDistance(const QString& a, const QString& b, int maxDist)
{
    const int aLen = a.size();
    const int bLen = b.size();

    if (a == b) {
        return 0;
    }
    if (aLen == 0) {
        return bLen <= maxDist ? bLen : maxDist + 1;
    }
    if (bLen == 0) {
        return aLen <= maxDist ? aLen : maxDist + 1;
    }
    if (std::abs(aLen - bLen) > maxDist) {
        return maxDist + 1;
    }

    // deletion, insertion, substitution, and adjacent transposition
    std::vector<int> prevPrev(bLen + 1, 0);
    std::vector<int> prev(bLen + 1);
    std::vector<int> curr(bLen + 1);
    for (int j = 0; j <= bLen; ++j) {
        prev[j] = j;
    }

    for (int i = 1; i <= aLen; ++i) {
        curr[0] = i;
        int rowMin = curr[0];

        for (int j = 1; j <= bLen; ++j) {
            const int cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            const int deletion = prev[j] + 1;
            const int insertion = curr[j - 1] + 1;
            const int substitution = prev[j - 1] + cost;
            curr[j] = std::min({deletion, insertion, substitution});

            if (i > 1 && j > 1 && a[i - 1] == b[j - 2] && a[i - 2] == b[j - 1]) {
                curr[j] = std::min(curr[j], prevPrev[j - 2] + 1);
            }

            rowMin = std::min(rowMin, curr[j]);
        }

        if (rowMin > maxDist) {
            return maxDist + 1;
        }

        prevPrev.swap(prev);
        prev.swap(curr);
    }

    return prev[bLen] <= maxDist ? prev[bLen] : maxDist + 1;
}

double Similarity::tokenSimilarity(const QString& a, const QString& b)
{
    const int longest = std::max(a.size(), b.size());
    if (longest == 0) {
        return 1.0;
    }

    const int dist = editDistance(a, b, longest);
    return 1.0 - static_cast<double>(dist) / static_cast<double>(longest);
}

double Similarity::flooredSimilarity(const QString& a, const QString& b, double floor)
{
    const double similarity = tokenSimilarity(a, b);
    return similarity > floor ? similarity : 0.0;
}

} // namespace rw
