#ifndef SPONGE_REPORT_WRITER_H
#define SPONGE_REPORT_WRITER_H

#include "binding_site.h"
#include "cassette_assembler.h"
#include "coverage_selector.h"
#include "structure_estimator.h"

#include <cstddef>
#include <fstream>
#include <ostream>
#include <string>
#include <vector>

namespace sponge {

// ============================================================================
// Stream formatters (also used for console output)
// ============================================================================

void write_selection_table(std::ostream& os, const SelectionResult& result);

// Lowest-entropy elements of one cell type (mean 2 decimals, entropy 4)
void write_ranking_table(std::ostream& os, const std::string& cell_type, double threshold,
                         const std::vector<RankedElement>& ranked);

void write_region_table(std::ostream& os, const AssemblyResult& assembly);

void write_site_table(std::ostream& os, const std::vector<BindingSite>& sites);

void write_fasta_record(std::ostream& os, const std::string& name,
                        const std::string& sequence, size_t line_width = 60);

// Vienna style: >name, sequence, structure followed by " (<pairs>)"
void write_dot_bracket(std::ostream& os, const std::string& name, const FoldResult& fold);

// Comma separated, sorted (CellSet order)
std::string join_cells(const CellSet& cells);

// ============================================================================
// File writer
// ============================================================================

/**
 * ReportWriter: one output file, opened on construction.
 * Throws std::runtime_error when the file cannot be opened.
 */
class ReportWriter {
public:
    explicit ReportWriter(const std::string& path);

    std::ostream& stream() { return ofs_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ofstream ofs_;
};

}  // namespace sponge

#endif  // SPONGE_REPORT_WRITER_H
