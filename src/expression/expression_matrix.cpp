#include "expression_matrix.h"

#include <cmath>
#include <stdexcept>

namespace sponge {

void ExpressionMatrix::add_element(const std::string& element_id) {
    auto [it, inserted] = rows_.try_emplace(element_id);
    (void)it;
    if (inserted) {
        element_ids_.push_back(element_id);
    }
}

void ExpressionMatrix::set(const std::string& element_id,
                           const std::string& cell_type,
                           double value) {
    if (!std::isfinite(value) || value < 0.0) {
        throw std::invalid_argument(
            "Expression value for " + element_id + " / " + cell_type +
            " must be a finite non-negative number");
    }

    add_element(element_id);
    cell_types_.insert(cell_type);

    auto& row = rows_[element_id];
    auto it = row.find(cell_type);
    if (value == 0.0) {
        // sparse: drop an existing entry instead of storing a zero
        if (it != row.end()) {
            row.erase(it);
            --num_entries_;
        }
        return;
    }
    if (it == row.end()) {
        row.emplace(cell_type, value);
        ++num_entries_;
    } else {
        it->second = value;
    }
}

double ExpressionMatrix::mean(const std::string& element_id,
                              const std::string& cell_type) const {
    auto row_it = rows_.find(element_id);
    if (row_it == rows_.end()) return 0.0;
    auto it = row_it->second.find(cell_type);
    return it == row_it->second.end() ? 0.0 : it->second;
}

std::string ElementCatalog::seed_of(const std::string& element_id) const {
    auto it = seeds.find(element_id);
    return it == seeds.end() ? std::string() : it->second;
}

std::string ElementCatalog::mature_of(const std::string& element_id) const {
    auto it = mature_seqs.find(element_id);
    return it == mature_seqs.end() ? std::string() : it->second;
}

}  // namespace sponge
