#ifndef SPONGE_DESIGN_PIPELINE_H
#define SPONGE_DESIGN_PIPELINE_H

#include "binding_site.h"
#include "cassette_assembler.h"
#include "coverage_selector.h"
#include "data_loader.h"
#include "expression_matrix.h"
#include "structure_estimator.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sponge {

enum class FoldTarget : uint8_t {
    kNone = 0,
    kCassette = 1,   // sites + spacers (default preview)
    kUtr3 = 2,       // stop codon .. poly-A
    kFull = 3        // context + utr3
};

const char* fold_target_name(FoldTarget target);

// Throws std::invalid_argument for unknown names
FoldTarget parse_fold_target(const std::string& name);

// ============================================================================
// Pipeline Configuration
// ============================================================================

struct DesignConfig {
    // Expression input: a mean matrix, or samples + metadata
    std::string matrix_path;
    std::string samples_path;
    std::string metadata_path;
    AggregationConfig aggregation;

    // Element catalog
    std::string catalog_path;
    std::string seed_map_path;
    int32_t species_id = kHumanSpeciesId;

    // Selection (empty off_targets = every other cell type)
    CellSet targets;
    CellSet off_targets;
    double target_threshold = 10.0;
    double cover_threshold = 1000.0;
    int32_t max_elements = 20;

    // Assembly
    int32_t num_sites = kDefaultNumSites;
    std::string utr5_fasta_path;
    std::string cds_fasta_path;

    // Structure preview
    FoldTarget fold_target = FoldTarget::kCassette;
    FoldConfig fold;

    // Output (empty prefix = console only)
    std::string output_prefix;
    bool verbose = false;
};

// ============================================================================
// Pipeline Output
// ============================================================================

struct DesignResult {
    SelectionResult selection;
    std::vector<BindingSite> sites;
    AssemblyResult assembly;
    double utr3_gc = 0.0;      // G+C fraction of assembly.utr3

    bool has_fold = false;
    FoldResult fold;
    size_t fold_offset = 0;    // start of the folded range in full_sequence

    std::vector<std::string> written_files;
};

// ============================================================================
// DesignPipeline: select -> synthesize -> assemble -> fold -> write
// ============================================================================

class DesignPipeline {
public:
    explicit DesignPipeline(const DesignConfig& config);

    /**
     * Load inputs from config paths and run every phase.
     * Throws std::runtime_error on I/O failures and std::invalid_argument on
     * bad parameters.
     */
    DesignResult run();

    // Same, on inputs already in memory (no loading phase)
    DesignResult run(const ExpressionMatrix& matrix, const ElementCatalog& catalog);

    ExpressionMatrix load_matrix() const;
    ElementCatalog load_catalog_from_config() const;
    LeadingContext load_context() const;

    SelectionParams selection_params(const ExpressionMatrix& matrix) const;

    // Single target without explicit off-targets goes through select_for_target
    SelectionResult select(const ExpressionMatrix& matrix, const ElementCatalog& catalog) const;

    const DesignConfig& config() const { return config_; }

private:
    DesignConfig config_;

    void fold_preview(DesignResult& result) const;
    void write_outputs(DesignResult& result) const;
};

}  // namespace sponge

#endif  // SPONGE_DESIGN_PIPELINE_H
