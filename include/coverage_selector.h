#ifndef SPONGE_COVERAGE_SELECTOR_H
#define SPONGE_COVERAGE_SELECTOR_H

#include "expression_matrix.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sponge {

// ============================================================================
// Selection parameters / results
// ============================================================================

struct SelectionParams {
    CellSet targets;        // 保护：这些细胞中必须沉默
    CellSet off_targets;    // 抑制：需要被覆盖的细胞

    double target_threshold = 10.0;    // silent iff mean < threshold (exclusive)
    double cover_threshold = 1000.0;   // covers iff mean >= threshold (inclusive)
    int32_t max_elements = 20;         // hard cap on panel size
};

struct SelectionStep {
    std::string element_id;
    std::string seed;
    std::string mature_seq;
    double mean_target_value = 0.0;   // mean over all targets
    CellSet newly_covered;
};

struct SelectionResult {
    bool success = false;
    std::vector<std::string> selected;   // selection order, no duplicates
    std::vector<SelectionStep> steps;
    CellSet uncovered;
    CellSet all_off_targets;

    // Elements silent in every target (before the greedy loop)
    size_t candidate_count = 0;

    double covered_fraction() const {
        if (all_off_targets.empty()) return 0.0;
        return 1.0 - static_cast<double>(uncovered.size()) /
                     static_cast<double>(all_off_targets.size());
    }
};

// ============================================================================
// Greedy maximum-coverage selector
// ============================================================================

/**
 * Pick a panel of elements that are silent in every target and together
 * reach cover_threshold in every off-target.
 *
 * Candidates are scanned in matrix row order; the first candidate with the
 * strictly largest gain wins a round. A round with zero gain, an empty
 * uncovered set or the max_elements cap ends the loop. Infeasible designs
 * come back with success=false and a non-empty uncovered set.
 *
 * Empty targets or off_targets return success=false with nothing selected.
 * Throws std::invalid_argument for max_elements < 1 or negative /
 * non-finite thresholds.
 */
SelectionResult select_elements(const ExpressionMatrix& matrix,
                                 const ElementCatalog& catalog,
                                 const SelectionParams& params);

/**
 * Protect a single cell type and treat every other cell type of the matrix as
 * an off-target. params.targets / params.off_targets are ignored.
 * Throws std::invalid_argument (listing the available cell types) when target
 * is not a column of the matrix.
 */
SelectionResult select_for_target(const ExpressionMatrix& matrix,
                                  const ElementCatalog& catalog,
                                  const std::string& target,
                                  const SelectionParams& params);

// All matrix cell types except the targets.
CellSet complement_cell_types(const ExpressionMatrix& matrix, const CellSet& targets);

// ============================================================================
// Cell-type specificity ranking
// ============================================================================

struct RankedElement {
    std::string element_id;
    std::string mature_seq;     // empty when the catalog has none
    double mean = 0.0;          // mean in the ranked cell type
    double entropy = 0.0;       // bits, across all cell types
};

// Base-2 Shannon entropy of an element's means over all cell types of the
// matrix. 0 when the row sums to zero.
double expression_entropy(const ExpressionMatrix& matrix, const std::string& element_id);

/**
 * Elements with mean >= threshold in cell_type, lowest entropy first (most
 * cell-type specific), at most top_n of them. Equal entropies keep matrix row
 * order.
 *
 * Throws std::invalid_argument (listing the available cell types) when
 * cell_type is not a column of the matrix, or for a non-finite threshold.
 */
std::vector<RankedElement> rank_specific_elements(const ExpressionMatrix& matrix,
                                                  const ElementCatalog& catalog,
                                                  const std::string& cell_type,
                                                  double threshold,
                                                  size_t top_n);

}  // namespace sponge

#endif  // SPONGE_COVERAGE_SELECTOR_H
