#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace rougel::algo {

using TokenSequence = std::vector<std::string>;
using LcsTable = std::vector<std::vector<std::size_t>>;

// Length of the longest common subsequence. Two rolling rows sized by the
// shorter sequence; returns 0 when either side is empty.
std::size_t lcsLength(const TokenSequence& seq1, const TokenSequence& seq2);

// Full (m+1) x (n+1) table; table[m][n] == lcsLength(seq1, seq2).
LcsTable lcsTable(const TokenSequence& seq1, const TokenSequence& seq2);

} // namespace rougel::algo
