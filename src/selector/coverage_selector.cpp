#include "coverage_selector.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace sponge {

namespace {

void validate_params(const SelectionParams& params) {
    if (params.max_elements < 1) {
        throw std::invalid_argument("max_elements must be >= 1, got " +
                                    std::to_string(params.max_elements));
    }
    if (!std::isfinite(params.target_threshold) || params.target_threshold < 0.0) {
        throw std::invalid_argument("target_threshold must be a finite non-negative number");
    }
    if (!std::isfinite(params.cover_threshold) || params.cover_threshold < 0.0) {
        throw std::invalid_argument("cover_threshold must be a finite non-negative number");
    }
}

void require_cell_type(const ExpressionMatrix& matrix, const std::string& cell_type,
                       const char* what) {
    if (matrix.has_cell_type(cell_type)) return;
    std::ostringstream oss;
    oss << what << " '" << cell_type << "' not found. Available cell types:";
    for (const auto& ct : matrix.cell_types()) {
        oss << "\n  " << ct;
    }
    throw std::invalid_argument(oss.str());
}

// Candidate with its coverage as indices into the off-target vector
struct Candidate {
    const std::string* element_id = nullptr;
    std::vector<size_t> covers;
    bool selected = false;
};

}  // namespace

CellSet complement_cell_types(const ExpressionMatrix& matrix, const CellSet& targets) {
    CellSet others;
    for (const auto& ct : matrix.cell_types()) {
        if (targets.count(ct) == 0) others.insert(ct);
    }
    return others;
}

SelectionResult select_elements(const ExpressionMatrix& matrix,
                                 const ElementCatalog& catalog,
                                 const SelectionParams& params) {
    validate_params(params);

    SelectionResult result;
    result.all_off_targets = params.off_targets;
    result.uncovered = params.off_targets;

    if (params.targets.empty() || params.off_targets.empty()) {
        result.success = false;
        return result;
    }

    const std::vector<std::string> off_targets(params.off_targets.begin(),
                                               params.off_targets.end());

    // ------------------------------------------------------------------
    // 1. Candidate filter: silent in every target simultaneously
    // 2. Coverage precomputation
    // ------------------------------------------------------------------
    std::vector<Candidate> candidates;
    for (const auto& element_id : matrix.element_ids()) {
        bool silent = true;
        for (const auto& target : params.targets) {
            if (matrix.mean(element_id, target) >= params.target_threshold) {
                silent = false;
                break;
            }
        }
        if (!silent) continue;

        Candidate cand;
        cand.element_id = &element_id;
        for (size_t oi = 0; oi < off_targets.size(); ++oi) {
            if (matrix.mean(element_id, off_targets[oi]) >= params.cover_threshold) {
                cand.covers.push_back(oi);
            }
        }
        candidates.push_back(std::move(cand));
    }
    result.candidate_count = candidates.size();

    // ------------------------------------------------------------------
    // 3. Greedy maximum coverage
    // ------------------------------------------------------------------
    std::vector<bool> is_uncovered(off_targets.size(), true);
    size_t n_uncovered = off_targets.size();

    while (n_uncovered > 0 &&
           result.selected.size() < static_cast<size_t>(params.max_elements)) {
        Candidate* best = nullptr;
        size_t best_gain = 0;

        for (auto& cand : candidates) {
            if (cand.selected) continue;
            size_t gain = 0;
            for (size_t oi : cand.covers) {
                if (is_uncovered[oi]) ++gain;
            }
            // strict '>' keeps the first candidate on ties
            if (gain > best_gain) {
                best = &cand;
                best_gain = gain;
            }
        }

        if (best == nullptr || best_gain == 0) break;

        // ------------------------------------------------------------------
        // 4. Record the step
        // ------------------------------------------------------------------
        const std::string& element_id = *best->element_id;

        SelectionStep step;
        step.element_id = element_id;
        step.seed = catalog.seed_of(element_id);
        step.mature_seq = catalog.mature_of(element_id);

        double sum = 0.0;
        for (const auto& target : params.targets) {
            sum += matrix.mean(element_id, target);
        }
        step.mean_target_value = sum / static_cast<double>(params.targets.size());

        for (size_t oi : best->covers) {
            if (!is_uncovered[oi]) continue;
            step.newly_covered.insert(off_targets[oi]);
            is_uncovered[oi] = false;
            result.uncovered.erase(off_targets[oi]);
            --n_uncovered;
        }

        best->selected = true;
        result.selected.push_back(element_id);
        result.steps.push_back(std::move(step));
    }

    result.success = result.uncovered.empty();
    return result;
}

SelectionResult select_for_target(const ExpressionMatrix& matrix,
                                  const ElementCatalog& catalog,
                                  const std::string& target,
                                  const SelectionParams& params) {
    require_cell_type(matrix, target, "Target");

    SelectionParams single = params;
    single.targets = {target};
    single.off_targets = complement_cell_types(matrix, single.targets);
    return select_elements(matrix, catalog, single);
}

double expression_entropy(const ExpressionMatrix& matrix, const std::string& element_id) {
    double total = 0.0;
    for (const auto& ct : matrix.cell_types()) {
        total += matrix.mean(element_id, ct);
    }
    if (total <= 0.0) return 0.0;

    double h = 0.0;
    for (const auto& ct : matrix.cell_types()) {
        const double p = matrix.mean(element_id, ct) / total;
        if (p > 0.0) h -= p * std::log2(p);
    }
    return h;
}

std::vector<RankedElement> rank_specific_elements(const ExpressionMatrix& matrix,
                                                  const ElementCatalog& catalog,
                                                  const std::string& cell_type,
                                                  double threshold,
                                                  size_t top_n) {
    require_cell_type(matrix, cell_type, "Cell type");
    if (!std::isfinite(threshold)) {
        throw std::invalid_argument("threshold must be a finite number");
    }

    std::vector<RankedElement> ranked;
    for (const auto& element_id : matrix.element_ids()) {
        const double mean = matrix.mean(element_id, cell_type);
        if (mean < threshold) continue;

        RankedElement row;
        row.element_id = element_id;
        row.mature_seq = catalog.mature_of(element_id);
        row.mean = mean;
        row.entropy = expression_entropy(matrix, element_id);
        ranked.push_back(std::move(row));
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const RankedElement& a, const RankedElement& b) {
                         return a.entropy < b.entropy;
                     });
    if (ranked.size() > top_n) {
        ranked.resize(top_n);
    }
    return ranked;
}

}  // namespace sponge
