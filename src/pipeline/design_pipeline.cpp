#include "design_pipeline.h"
#include "report_writer.h"
#include "sequence_utils.h"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace sponge {

namespace {

std::string gc_percent(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << fraction * 100.0 << "%";
    return oss.str();
}

}  // namespace

const char* fold_target_name(FoldTarget target) {
    switch (target) {
        case FoldTarget::kNone: return "none";
        case FoldTarget::kCassette: return "cassette";
        case FoldTarget::kUtr3: return "utr3";
        case FoldTarget::kFull: return "full";
    }
    return "unknown";
}

FoldTarget parse_fold_target(const std::string& name) {
    if (name == "none") return FoldTarget::kNone;
    if (name == "cassette") return FoldTarget::kCassette;
    if (name == "utr3") return FoldTarget::kUtr3;
    if (name == "full") return FoldTarget::kFull;
    throw std::invalid_argument("Unknown fold target '" + name +
                                "' (expected cassette, utr3, full or none)");
}

DesignPipeline::DesignPipeline(const DesignConfig& config) : config_(config) {}

// ============================================================================
// Input loading
// ============================================================================

ExpressionMatrix DesignPipeline::load_matrix() const {
    if (!config_.matrix_path.empty()) {
        return load_mean_matrix(config_.matrix_path);
    }
    if (config_.samples_path.empty() || config_.metadata_path.empty()) {
        throw std::invalid_argument(
            "An expression matrix or samples + metadata files are required");
    }

    // seed map 限定已知 miRNA
    std::set<std::string> known_ids;
    if (!config_.seed_map_path.empty()) {
        known_ids = load_seed_map_ids(config_.seed_map_path);
    }

    AggregationConfig agg = config_.aggregation;
    agg.verbose = agg.verbose || config_.verbose;

    AggregationStats stats;
    ExpressionMatrix matrix = aggregate_sample_matrix(
        config_.samples_path, config_.metadata_path, agg, known_ids, &stats);

    std::cout << "  Aggregated " << stats.kept_elements << " / "
              << stats.input_elements << " elements over "
              << stats.input_samples << " samples" << std::endl;
    if (config_.verbose) {
        std::cout << "    low expression: " << stats.dropped_low_expression
                  << ", unknown id: " << stats.dropped_unknown
                  << ", zero total: " << stats.dropped_zero_total
                  << ", samples without metadata: " << stats.unmapped_samples
                  << std::endl;
    }
    return matrix;
}

ElementCatalog DesignPipeline::load_catalog_from_config() const {
    ElementCatalog catalog;
    if (!config_.catalog_path.empty()) {
        catalog = load_catalog(config_.catalog_path, config_.species_id);
    }
    if (!config_.seed_map_path.empty()) {
        const size_t n = apply_seed_map(config_.seed_map_path, catalog);
        if (config_.verbose) {
            std::cout << "  Seed map: " << n << " seeds applied" << std::endl;
        }
    }
    return catalog;
}

LeadingContext DesignPipeline::load_context() const {
    LeadingContext context;
    if (!config_.utr5_fasta_path.empty()) {
        context.utr5 = load_context_sequence(config_.utr5_fasta_path);
    }
    if (!config_.cds_fasta_path.empty()) {
        context.cds = load_context_sequence(config_.cds_fasta_path);
    }
    return context;
}

SelectionParams DesignPipeline::selection_params(const ExpressionMatrix& matrix) const {
    SelectionParams params;
    params.targets = config_.targets;
    params.off_targets = config_.off_targets.empty()
        ? complement_cell_types(matrix, config_.targets)
        : config_.off_targets;
    params.target_threshold = config_.target_threshold;
    params.cover_threshold = config_.cover_threshold;
    params.max_elements = config_.max_elements;
    return params;
}

SelectionResult DesignPipeline::select(const ExpressionMatrix& matrix,
                                       const ElementCatalog& catalog) const {
    if (config_.targets.size() == 1 && config_.off_targets.empty()) {
        return select_for_target(matrix, catalog, *config_.targets.begin(),
                                 selection_params(matrix));
    }
    return select_elements(matrix, catalog, selection_params(matrix));
}

// ============================================================================
// Run
// ============================================================================

DesignResult DesignPipeline::run() {
    std::cout << "=== SPONGE Design ===" << std::endl;

    std::cout << "\n[Phase 1] Loading inputs..." << std::endl;
    ExpressionMatrix matrix = load_matrix();
    std::cout << "  Matrix: " << matrix.num_elements() << " elements x "
              << matrix.num_cell_types() << " cell types" << std::endl;

    ElementCatalog catalog = load_catalog_from_config();
    std::cout << "  Catalog: " << catalog.size() << " elements" << std::endl;

    return run(matrix, catalog);
}

DesignResult DesignPipeline::run(const ExpressionMatrix& matrix,
                                 const ElementCatalog& catalog) {
    DesignResult result;
    auto start_time = std::chrono::high_resolution_clock::now();

    for (const auto& target : config_.targets) {
        if (!matrix.has_cell_type(target)) {
            throw std::invalid_argument("Unknown target cell type: " + target);
        }
    }

    // ================================================================
    // Phase 2: greedy selection
    // ================================================================
    std::cout << "\n[Phase 2] Selecting miRNA panel..." << std::endl;
    const SelectionParams params = selection_params(matrix);
    std::cout << "  Targets: " << join_cells(params.targets) << std::endl;
    std::cout << "  Off-targets: " << params.off_targets.size() << std::endl;

    result.selection = select(matrix, catalog);
    const auto& sel = result.selection;
    std::cout << "  Candidates silent in targets: " << sel.candidate_count << std::endl;
    std::cout << "  Selected " << sel.selected.size() << " miRNAs, covered "
              << (sel.all_off_targets.size() - sel.uncovered.size()) << " / "
              << sel.all_off_targets.size() << " off-targets" << std::endl;
    if (!sel.success && !sel.uncovered.empty()) {
        std::cerr << "[Warn] Uncovered off-targets: " << join_cells(sel.uncovered)
                  << std::endl;
    }
    if (config_.verbose) {
        for (size_t i = 0; i < sel.steps.size(); ++i) {
            const auto& step = sel.steps[i];
            std::cout << "    " << (i + 1) << ". " << step.element_id
                      << " (+" << step.newly_covered.size() << ")" << std::endl;
        }
    }

    if (sel.steps.empty()) {
        std::cerr << "[Warn] No candidate miRNAs found; try a higher target "
                     "threshold or a lower cover threshold" << std::endl;
        write_outputs(result);
        return result;
    }

    // ================================================================
    // Phase 3: binding sites
    // ================================================================
    std::cout << "\n[Phase 3] Synthesizing binding sites..." << std::endl;
    std::vector<SelectionStep> usable;
    for (const auto& step : sel.steps) {
        if (step.mature_seq.empty()) {
            std::cerr << "[Warn] No mature sequence for " << step.element_id
                      << ", site skipped" << std::endl;
            continue;
        }
        usable.push_back(step);
    }
    result.sites = synthesize_sites(usable);
    std::cout << "  Built " << result.sites.size() << " sites" << std::endl;

    // ================================================================
    // Phase 4: cassette
    // ================================================================
    std::cout << "\n[Phase 4] Assembling 3'UTR cassette..." << std::endl;
    result.assembly = assemble_cassette(result.sites, config_.num_sites, load_context());
    result.utr3_gc = gc_content(result.assembly.utr3);
    std::cout << "  3'UTR: " << result.assembly.utr3.size() << " nt ("
              << gc_percent(result.utr3_gc) << " GC), full: "
              << result.assembly.full_sequence.size() << " nt, "
              << result.assembly.regions.size() << " regions" << std::endl;

    // ================================================================
    // Phase 5: structure preview
    // ================================================================
    if (config_.fold_target != FoldTarget::kNone) {
        std::cout << "\n[Phase 5] Folding (" << fold_target_name(config_.fold_target)
                  << ")..." << std::endl;
        fold_preview(result);
    }

    // ================================================================
    // Output
    // ================================================================
    write_outputs(result);

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time - start_time);
    std::cout << "\nTotal time: " << duration.count() << "ms" << std::endl;

    return result;
}

void DesignPipeline::fold_preview(DesignResult& result) const {
    const auto& assembly = result.assembly;
    if (assembly.full_sequence.empty()) return;

    size_t begin = 0;
    size_t end = assembly.full_sequence.size();
    switch (config_.fold_target) {
        case FoldTarget::kCassette:
            begin = cassette_offset(assembly);
            end = begin + assembly.cassette.size();
            break;
        case FoldTarget::kUtr3:
            begin = end - assembly.utr3.size();
            break;
        case FoldTarget::kFull:
        case FoldTarget::kNone:
            break;
    }

    const size_t length = end - begin;
    if (config_.fold.max_length > 0 && length > config_.fold.max_length) {
        std::cerr << "[Warn] Fold skipped: " << length << " nt exceeds max length "
                  << config_.fold.max_length << std::endl;
        return;
    }

    result.fold = fold_window(assembly.full_sequence, begin, end);
    result.fold_offset = begin;
    result.has_fold = true;
    std::cout << "  " << length << " nt, " << result.fold.num_pairs()
              << " base pairs, " << gc_percent(gc_content(result.fold.sequence))
              << " GC" << std::endl;
}

void DesignPipeline::write_outputs(DesignResult& result) const {
    if (config_.output_prefix.empty()) return;

    std::cout << "\n[Output] Writing " << config_.output_prefix << ".*" << std::endl;
    const std::string& prefix = config_.output_prefix;

    {
        ReportWriter writer(prefix + ".selection.tsv");
        write_selection_table(writer.stream(), result.selection);
        result.written_files.push_back(writer.path());
    }

    if (!result.sites.empty()) {
        ReportWriter writer(prefix + ".sites.tsv");
        write_site_table(writer.stream(), result.sites);
        result.written_files.push_back(writer.path());
    }

    if (!result.assembly.full_sequence.empty()) {
        {
            ReportWriter writer(prefix + ".regions.tsv");
            write_region_table(writer.stream(), result.assembly);
            result.written_files.push_back(writer.path());
        }
        ReportWriter writer(prefix + ".fa");
        write_fasta_record(writer.stream(), "sponge_utr3", result.assembly.utr3);
        if (!result.assembly.utr5.empty() || !result.assembly.cds.empty()) {
            write_fasta_record(writer.stream(), "sponge_full", result.assembly.full_sequence);
        }
        result.written_files.push_back(writer.path());
    }

    if (result.has_fold) {
        ReportWriter writer(prefix + ".dbn");
        write_dot_bracket(writer.stream(),
                          std::string("sponge_") + fold_target_name(config_.fold_target) +
                              " offset=" + std::to_string(result.fold_offset),
                          result.fold);
        result.written_files.push_back(writer.path());
    }

    for (const auto& path : result.written_files) {
        std::cout << "  " << path << std::endl;
    }
}

}  // namespace sponge
