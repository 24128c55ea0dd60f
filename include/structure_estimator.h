#ifndef SPONGE_STRUCTURE_ESTIMATOR_H
#define SPONGE_STRUCTURE_ESTIMATOR_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sponge {

// ============================================================================
// Maximum base-pairing fold (Nussinov-style)
// ============================================================================

// Pair (k, j) needs j - k > kMinHairpinLoop
constexpr int32_t kMinHairpinLoop = 3;
// Shorter inputs come back all unpaired
constexpr size_t kMinFoldLength = 5;

struct FoldConfig {
    // 最大折叠长度 (O(n^2) 内存, O(n^3) 时间); 0 = no limit
    size_t max_length = 2000;
};

using BasePair = std::pair<size_t, size_t>;

struct FoldResult {
    std::string sequence;            // normalised upper-case RNA
    std::vector<BasePair> pairs;     // i < j, sorted by i
    std::string dot_bracket;         // '(' at i, ')' at j, '.' elsewhere

    size_t num_pairs() const { return pairs.size(); }
};

/**
 * Estimate a non-crossing structure maximising the number of Watson-Crick and
 * G-U pairs with a minimum hairpin loop of 3.
 *
 * Case-insensitive, T is read as U, other letters never pair. Traceback
 * prefers "j unpaired" on ties, then the smallest pairing partner k.
 * O(n^3) time, O(n^2) memory.
 */
FoldResult fold_structure(std::string_view sequence);

/**
 * Fold sequence[begin, end) and report pairs in full-sequence coordinates.
 * dot_bracket and sequence cover the window only.
 * Throws std::out_of_range when begin > end or end > sequence.size().
 */
FoldResult fold_window(std::string_view sequence, size_t begin, size_t end);

// Pairs outside [0, length) are ignored
std::string dot_bracket_from_pairs(const std::vector<BasePair>& pairs, size_t length);

}  // namespace sponge

#endif  // SPONGE_STRUCTURE_ESTIMATOR_H
