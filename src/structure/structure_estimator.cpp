#include "structure_estimator.h"
#include "sequence_utils.h"

#include <algorithm>
#include <stdexcept>

namespace sponge {

namespace {

// Upper-triangular score table stored row-major in a flat vector
class PairingTable {
public:
    explicit PairingTable(size_t n) : n_(n), cells_(n * n, 0) {}

    int32_t at(size_t i, size_t j) const { return cells_[i * n_ + j]; }
    void set(size_t i, size_t j, int32_t v) { cells_[i * n_ + j] = v; }

    // Score of [i, j], 0 for empty or inverted ranges
    int32_t range(size_t i, size_t j) const {
        return (i < j) ? at(i, j) : 0;
    }

private:
    size_t n_;
    std::vector<int32_t> cells_;
};

int32_t pair_score(const PairingTable& dp, size_t i, size_t k, size_t j) {
    const int32_t left = (k > i) ? dp.range(i, k - 1) : 0;
    const int32_t inner = (k + 1 <= j - 1) ? dp.range(k + 1, j - 1) : 0;
    return left + 1 + inner;
}

}  // namespace

FoldResult fold_structure(std::string_view sequence) {
    FoldResult result;
    result.sequence = normalize_rna(sequence);
    const size_t n = result.sequence.size();
    result.dot_bracket.assign(n, '.');

    if (n < kMinFoldLength) {
        return result;
    }

    const std::string& seq = result.sequence;
    const size_t min_loop = static_cast<size_t>(kMinHairpinLoop);
    PairingTable dp(n);

    // ------------------------------------------------------------------
    // Fill: increasing span
    // ------------------------------------------------------------------
    for (size_t span = min_loop + 1; span < n; ++span) {
        for (size_t i = 0; i + span < n; ++i) {
            const size_t j = i + span;
            // j unpaired
            int32_t best = dp.at(i, j - 1);
            // j paired with k
            for (size_t k = i; k + min_loop < j; ++k) {
                if (!can_pair(seq[k], seq[j])) continue;
                best = std::max(best, pair_score(dp, i, k, j));
            }
            dp.set(i, j, best);
        }
    }

    // ------------------------------------------------------------------
    // Traceback with an explicit stack
    // ------------------------------------------------------------------
    std::vector<std::pair<size_t, size_t>> stack;
    stack.emplace_back(0, n - 1);

    while (!stack.empty()) {
        auto [i, j] = stack.back();
        stack.pop_back();
        if (i >= j) continue;

        const int32_t score = dp.at(i, j);
        if (score == dp.at(i, j - 1)) {
            stack.emplace_back(i, j - 1);
            continue;
        }

        for (size_t k = i; k + min_loop < j; ++k) {
            if (!can_pair(seq[k], seq[j])) continue;
            if (pair_score(dp, i, k, j) != score) continue;

            result.pairs.emplace_back(k, j);
            stack.emplace_back(k + 1, j - 1);
            if (k > i) stack.emplace_back(i, k - 1);
            break;
        }
    }

    std::sort(result.pairs.begin(), result.pairs.end());
    result.dot_bracket = dot_bracket_from_pairs(result.pairs, n);
    return result;
}

FoldResult fold_window(std::string_view sequence, size_t begin, size_t end) {
    if (begin > end || end > sequence.size()) {
        throw std::out_of_range(
            "Fold window [" + std::to_string(begin) + ", " + std::to_string(end) +
            ") outside sequence of length " + std::to_string(sequence.size()));
    }

    FoldResult result = fold_structure(sequence.substr(begin, end - begin));
    for (auto& pair : result.pairs) {
        pair.first += begin;
        pair.second += begin;
    }
    return result;
}

std::string dot_bracket_from_pairs(const std::vector<BasePair>& pairs, size_t length) {
    std::string out(length, '.');
    for (const auto& [i, j] : pairs) {
        if (i < length && j < length) {
            out[i] = '(';
            out[j] = ')';
        }
    }
    return out;
}

}  // namespace sponge
