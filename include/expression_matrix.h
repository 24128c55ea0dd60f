#ifndef SPONGE_EXPRESSION_MATRIX_H
#define SPONGE_EXPRESSION_MATRIX_H

#include <cstddef>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace sponge {

using CellSet = std::set<std::string>;

// ============================================================================
// ExpressionMatrix
// ============================================================================

/**
 * Sparse element x cell-type mean expression (RPM).
 *
 * - Absent entries read as 0.
 * - element_ids() keeps first-seen row order; greedy scans and tie-breaks
 *   follow this order.
 * - The selector only takes the matrix by const reference.
 */
class ExpressionMatrix {
public:
    ExpressionMatrix() = default;

    /**
     * Store a mean value. Zero values register the element and cell type but
     * are not stored. Throws std::invalid_argument for negative or non-finite
     * values.
     */
    void set(const std::string& element_id, const std::string& cell_type, double value);

    // Register an element row without values (keeps row order).
    void add_element(const std::string& element_id);

    double mean(const std::string& element_id, const std::string& cell_type) const;

    bool has_element(const std::string& element_id) const {
        return rows_.count(element_id) > 0;
    }
    bool has_cell_type(const std::string& cell_type) const {
        return cell_types_.count(cell_type) > 0;
    }

    const std::vector<std::string>& element_ids() const { return element_ids_; }
    const CellSet& cell_types() const { return cell_types_; }

    size_t num_elements() const { return element_ids_.size(); }
    size_t num_cell_types() const { return cell_types_.size(); }
    // Stored (non-zero) entries
    size_t num_entries() const { return num_entries_; }

    bool empty() const { return element_ids_.empty(); }

private:
    std::vector<std::string> element_ids_;
    CellSet cell_types_;
    std::unordered_map<std::string, std::unordered_map<std::string, double>> rows_;
    size_t num_entries_ = 0;
};

// ============================================================================
// ElementCatalog
// ============================================================================

/**
 * Element id -> seed and element id -> mature sequence.
 * Mature sequences may still carry DNA 'T'; the synthesizer normalises them.
 */
struct ElementCatalog {
    std::unordered_map<std::string, std::string> seeds;
    std::unordered_map<std::string, std::string> mature_seqs;

    // Empty string when unknown
    std::string seed_of(const std::string& element_id) const;
    std::string mature_of(const std::string& element_id) const;

    size_t size() const { return mature_seqs.size(); }
    bool empty() const { return mature_seqs.empty() && seeds.empty(); }
};

}  // namespace sponge

#endif  // SPONGE_EXPRESSION_MATRIX_H
