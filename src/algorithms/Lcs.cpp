#include "rougel/algorithms/Lcs.hpp"

#include <algorithm>

namespace rougel::algo {

std::size_t lcsLength(const TokenSequence& seq1, const TokenSequence& seq2) {
    if (seq1.empty() || seq2.empty()) return 0;

    // LCS length is symmetric, so iterate rows over the longer side.
    const TokenSequence& rows = seq1.size() >= seq2.size() ? seq1 : seq2;
    const TokenSequence& cols = seq1.size() >= seq2.size() ? seq2 : seq1;
    const std::size_t m = rows.size();
    const std::size_t n = cols.size();

    std::vector<std::size_t> prev(n + 1, 0), curr(n + 1, 0);

    for (std::size_t i = 1; i <= m; ++i) {
        curr[0] = 0;
        for (std::size_t j = 1; j <= n; ++j) {
            if (rows[i - 1] == cols[j - 1]) {
                curr[j] = prev[j - 1] + 1;
            } else {
                curr[j] = std::max(prev[j], curr[j - 1]);
            }
        }
        std::swap(prev, curr);
    }
    return prev[n];
}

LcsTable lcsTable(const TokenSequence& seq1, const TokenSequence& seq2) {
    const std::size_t m = seq1.size();
    const std::size_t n = seq2.size();
    LcsTable dp(m + 1, std::vector<std::size_t>(n + 1, 0));

    for (std::size_t i = 1; i <= m; ++i) {
        for (std::size_t j = 1; j <= n; ++j) {
            if (seq1[i - 1] == seq2[j - 1]) {
                dp[i][j] = dp[i - 1][j - 1] + 1;
            } else {
                dp[i][j] = std::max(dp[i - 1][j], dp[i][j - 1]);
            }
        }
    }
    return dp;
}

} // namespace rougel::algo
