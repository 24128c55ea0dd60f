#ifndef SPONGE_DATA_LOADER_H
#define SPONGE_DATA_LOADER_H

#include "expression_matrix.h"

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace sponge {

// ============================================================================
// Delimited text helpers
// ============================================================================

// '\t' for .tsv / .txt, ',' otherwise
char delimiter_for(const std::string& path);

/**
 * Split one line of a delimited file. Double-quoted fields may contain the
 * delimiter; "" inside quotes is a literal quote. A trailing '\r' is dropped.
 */
std::vector<std::string> split_fields(const std::string& line, char delim);

// ============================================================================
// Expression matrices
// ============================================================================

/**
 * Mean matrix: header "<id column>,<cell type>,...", one row per element.
 * Empty cells read as 0 and zeros are not stored.
 * Throws std::runtime_error on unreadable files, ragged rows or bad numbers.
 */
ExpressionMatrix load_mean_matrix(const std::string& path);

struct AggregationConfig {
    // 至少一个样本 > 该值才保留 (strict)
    double min_max_expression = 100.0;
    // metadata column holding the cell type label
    std::string cell_type_column = "CellType";
    bool verbose = false;
};

struct AggregationStats {
    size_t input_elements = 0;
    size_t input_samples = 0;
    size_t unmapped_samples = 0;        // samples without metadata
    size_t dropped_low_expression = 0;
    size_t dropped_unknown = 0;
    size_t dropped_zero_total = 0;
    size_t kept_elements = 0;
};

/**
 * Per-sample matrix (elements x samples) plus sample metadata
 * (sample id -> cell type) aggregated into per-cell-type means.
 *
 * Filters, in order: max over samples > min_max_expression, membership in
 * known_ids (skipped when known_ids is empty), non-zero total. Samples
 * without metadata still count for the filters but not for any mean.
 */
ExpressionMatrix aggregate_sample_matrix(const std::string& samples_path,
                                         const std::string& metadata_path,
                                         const AggregationConfig& config = {},
                                         const std::set<std::string>& known_ids = {},
                                         AggregationStats* stats = nullptr);

// ============================================================================
// Element catalogs
// ============================================================================

constexpr int32_t kHumanSpeciesId = 9606;

/**
 * TargetScan miR_Family_Info table (tab separated). Keeps rows of
 * species_id; first row per MiRBase ID wins.
 */
ElementCatalog load_family_info(const std::string& path,
                                int32_t species_id = kHumanSpeciesId);

/**
 * Seed map with MiRBase_ID and seed columns. Seeds override those already in
 * the catalog; the last row for an id wins.
 * @return number of ids whose seed was set
 */
size_t apply_seed_map(const std::string& path, ElementCatalog& catalog);

// Known element ids of a seed map (used to restrict aggregation)
std::set<std::string> load_seed_map_ids(const std::string& path);

/**
 * Mature sequences from FASTA (record name = element id). The seed is taken
 * as nucleotides 2-8 of the mature sequence.
 */
ElementCatalog load_mature_fasta(const std::string& path);

// .fa / .fasta / .fna -> FASTA, anything else -> family table
ElementCatalog load_catalog(const std::string& path,
                            int32_t species_id = kHumanSpeciesId);

// Seed (nt 2-8) of a mature sequence, empty when too short
std::string derive_seed(const std::string& mature_seq);

/**
 * One record of a FASTA file: the named one, or the first when
 * record_name is empty. Throws std::runtime_error when it cannot be read.
 */
std::string load_context_sequence(const std::string& fasta_path,
                                  const std::string& record_name = "");

}  // namespace sponge

#endif  // SPONGE_DATA_LOADER_H
