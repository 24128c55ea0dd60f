/**
 * SPONGE - miRNA sponge 3'UTR designer
 *
 * Phases:
 * 1. Input loading (mean matrix or samples + metadata, element catalog)
 * 2. Greedy coverage selection (silent in targets, covering off-targets)
 * 3. Bulged binding-site synthesis
 * 4. Cassette assembly (stop codon, linkers, sites + spacers, poly-A signal)
 * 5. Maximum base-pairing structure preview
 *
 * rank: lowest-entropy (most cell-type specific) miRNAs of one cell type
 *
 * Output: <prefix>.selection.tsv / .sites.tsv / .regions.tsv / .fa / .dbn
 */

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "binding_site.h"
#include "cli_options.h"
#include "coverage_selector.h"
#include "data_loader.h"
#include "design_pipeline.h"
#include "report_writer.h"
#include "structure_estimator.h"

namespace sponge {
namespace {

constexpr const char* kVersion = "0.1";

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " <command> [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "SPONGE v" << kVersion << " - miRNA sponge 3'UTR designer" << std::endl;
    std::cout << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  list-cell-types  Print the cell types of an expression matrix" << std::endl;
    std::cout << "  select           Greedy miRNA panel selection" << std::endl;
    std::cout << "  rank             Most cell-type specific miRNAs (lowest entropy)"
              << std::endl;
    std::cout << "  design           select + binding sites + cassette + fold preview" << std::endl;
    std::cout << "  fold             Fold one sequence (dot-bracket)" << std::endl;
    std::cout << "  site             Bulged binding sites for mature sequences" << std::endl;
    std::cout << std::endl;
    std::cout << "Inputs:" << std::endl;
    std::cout << "  --matrix FILE          Mean expression matrix (CSV/TSV)" << std::endl;
    std::cout << "  --samples FILE         Per-sample matrix (with --metadata)" << std::endl;
    std::cout << "  --metadata FILE        Sample -> CellType table" << std::endl;
    std::cout << "  --min-expression X     Aggregation filter (default 100)" << std::endl;
    std::cout << "  --catalog FILE         miR family table or mature FASTA" << std::endl;
    std::cout << "  --seed-map FILE        MiRBase_ID -> seed overrides" << std::endl;
    std::cout << "  --species ID           Family table species (default 9606)" << std::endl;
    std::cout << std::endl;
    std::cout << "Selection:" << std::endl;
    std::cout << "  --target CT            Protected cell type (repeatable, required)" << std::endl;
    std::cout << "  --off-target CT        Cell type to cover (repeatable, "
                 "default: all others)" << std::endl;
    std::cout << "  --target-thresh X      Silent iff mean < X (default 10)" << std::endl;
    std::cout << "  --cover-thresh X       Covers iff mean >= X (default 1000)" << std::endl;
    std::cout << "  --max-elements N       Panel size cap (default 20)" << std::endl;
    std::cout << std::endl;
    std::cout << "Design:" << std::endl;
    std::cout << "  --num-sites N          Site slots in the cassette (default 16)" << std::endl;
    std::cout << "  --utr5 FASTA           5'UTR context" << std::endl;
    std::cout << "  --cds FASTA            CDS context" << std::endl;
    std::cout << "  --fold WHAT            cassette|utr3|full|none (default cassette)" << std::endl;
    std::cout << "  --max-fold-length N    Skip folding above N nt (default 2000, 0 = none)"
              << std::endl;
    std::cout << "  --out PREFIX           Write PREFIX.* report files" << std::endl;
    std::cout << std::endl;
    std::cout << "rank:" << std::endl;
    std::cout << "  --cell-type CT         Cell type to rank for (required)" << std::endl;
    std::cout << "  --threshold X          Keep mean >= X in CT (default 0)" << std::endl;
    std::cout << "  --top N                Rows to report (default 10)" << std::endl;
    std::cout << std::endl;
    std::cout << "fold / site:" << std::endl;
    std::cout << "  --seq SEQ              Input sequence (site: repeatable)" << std::endl;
    std::cout << "  --fasta FILE           Read the sequence from FASTA (fold)" << std::endl;
    std::cout << "  --name NAME            FASTA record (default: first)" << std::endl;
    std::cout << "  --id NAME              Element id, one per --seq (site)" << std::endl;
    std::cout << std::endl;
    std::cout << "  -v, --verbose  -h, --help  --version" << std::endl;
}

void require_targets(const DesignConfig& cfg) {
    if (cfg.targets.empty()) {
        throw std::invalid_argument("At least one --target is required");
    }
}

int run_list_cell_types(const CliOptions& opts) {
    DesignPipeline pipeline(opts.design);
    const ExpressionMatrix matrix = pipeline.load_matrix();
    for (const auto& cell_type : matrix.cell_types()) {
        std::cout << cell_type << "\n";
    }
    return 0;
}

int run_select(const CliOptions& opts) {
    require_targets(opts.design);
    DesignPipeline pipeline(opts.design);

    const ExpressionMatrix matrix = pipeline.load_matrix();
    const ElementCatalog catalog = pipeline.load_catalog_from_config();
    for (const auto& target : opts.design.targets) {
        if (!matrix.has_cell_type(target)) {
            throw std::invalid_argument("Unknown target cell type: " + target +
                                        " (available: " + join_cells(matrix.cell_types()) + ")");
        }
    }

    const SelectionResult result = pipeline.select(matrix, catalog);
    write_selection_table(std::cout, result);

    if (!opts.design.output_prefix.empty()) {
        ReportWriter writer(opts.design.output_prefix + ".selection.tsv");
        write_selection_table(writer.stream(), result);
        std::cerr << "  " << writer.path() << std::endl;
    }
    return 0;
}

int run_rank(const CliOptions& opts) {
    if (opts.cell_type.empty()) {
        throw std::invalid_argument("rank needs --cell-type");
    }
    DesignPipeline pipeline(opts.design);

    const ExpressionMatrix matrix = pipeline.load_matrix();
    const ElementCatalog catalog = pipeline.load_catalog_from_config();
    const std::vector<RankedElement> ranked =
        rank_specific_elements(matrix, catalog, opts.cell_type, opts.rank_threshold,
                               static_cast<size_t>(opts.top_n));
    if (ranked.empty()) {
        std::cerr << "[Warn] No miRNAs with mean expression >= " << opts.rank_threshold
                  << " in " << opts.cell_type << std::endl;
    }
    write_ranking_table(std::cout, opts.cell_type, opts.rank_threshold, ranked);

    if (!opts.design.output_prefix.empty()) {
        ReportWriter writer(opts.design.output_prefix + ".rank.tsv");
        write_ranking_table(writer.stream(), opts.cell_type, opts.rank_threshold, ranked);
        std::cerr << "  " << writer.path() << std::endl;
    }
    return 0;
}

int run_design(const CliOptions& opts) {
    require_targets(opts.design);
    DesignPipeline pipeline(opts.design);
    const DesignResult result = pipeline.run();

    if (result.assembly.utr3.empty()) {
        return 0;
    }
    std::cout << std::endl;
    write_fasta_record(std::cout, "sponge_utr3", result.assembly.utr3);
    if (result.has_fold) {
        std::cout << std::endl;
        write_dot_bracket(std::cout,
                          std::string("sponge_") + fold_target_name(opts.design.fold_target),
                          result.fold);
    }
    return 0;
}

int run_fold(const CliOptions& opts) {
    if (opts.seqs.size() > 1) {
        throw std::invalid_argument("fold takes a single --seq");
    }
    std::string sequence = opts.seqs.empty() ? std::string() : opts.seqs.front();
    std::string name = opts.record_name.empty() ? "input" : opts.record_name;
    if (sequence.empty()) {
        if (opts.fasta_path.empty()) {
            throw std::invalid_argument("fold needs --seq or --fasta");
        }
        sequence = load_context_sequence(opts.fasta_path, opts.record_name);
    }

    const size_t max_length = opts.design.fold.max_length;
    if (max_length > 0 && sequence.size() > max_length) {
        throw std::invalid_argument("Sequence of " + std::to_string(sequence.size()) +
                                    " nt exceeds --max-fold-length " +
                                    std::to_string(max_length));
    }

    const FoldResult fold = fold_structure(sequence);
    write_dot_bracket(std::cout, name, fold);
    return 0;
}

int run_site(const CliOptions& opts) {
    if (opts.seqs.empty()) {
        throw std::invalid_argument("site needs --seq");
    }
    if (opts.element_ids.size() > opts.seqs.size()) {
        throw std::invalid_argument("More --id than --seq values");
    }
    write_site_table(std::cout, synthesize_sites(opts.element_ids, opts.seqs));
    return 0;
}

}  // namespace
}  // namespace sponge

// ============================================================================
// Main
// ============================================================================

using namespace sponge;

int main(int argc, char* argv[]) {
    try {
        const CliOptions opts = parse_args(argc, argv);

        if (opts.version) {
            std::cout << "sponge " << kVersion << std::endl;
            return 0;
        }
        if (opts.help || opts.command.empty()) {
            print_usage(argv[0]);
            return opts.help ? 0 : 1;
        }

        if (opts.command == "list-cell-types") return run_list_cell_types(opts);
        if (opts.command == "select") return run_select(opts);
        if (opts.command == "rank") return run_rank(opts);
        if (opts.command == "design") return run_design(opts);
        if (opts.command == "fold") return run_fold(opts);
        if (opts.command == "site") return run_site(opts);

        std::cerr << "[Error] Unknown command: " << opts.command << std::endl;
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Error] " << e.what() << std::endl;
        return 1;
    }
}
