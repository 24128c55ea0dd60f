#include <algorithm>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "design_pipeline.h"
#include "sequence_utils.h"
#include "test_path_utils.h"

using namespace sponge;
using sponge_test::make_temp_dir;
using sponge_test::read_text_file;
using sponge_test::write_text_file;

// ============================================================================
// Test Helpers
// ============================================================================

void print_test_header(const std::string& name) {
    std::cout << "\nTesting " << name << "...\n";
}

void check_result(const std::string& name, bool passed) {
    std::cout << "  " << name << ": " << (passed ? "PASS" : "FAIL") << "\n";
    assert(passed);
}

// Liver-protecting panel: miR-122 is loud in liver, the others are silent
ExpressionMatrix make_matrix() {
    ExpressionMatrix m;
    m.set("hsa-miR-122-5p", "Liver", 50000.0);
    m.set("hsa-miR-122-5p", "Heart", 20.0);
    m.set("hsa-miR-1-3p", "Liver", 2.0);
    m.set("hsa-miR-1-3p", "Heart", 12000.0);
    m.set("hsa-miR-1-3p", "Muscle", 9000.0);
    m.set("hsa-miR-142-3p", "Liver", 5.0);
    m.set("hsa-miR-142-3p", "Blood", 30000.0);
    m.set("hsa-miR-9-5p", "Liver", 0.0);
    m.set("hsa-miR-9-5p", "Brain", 800.0);
    return m;
}

ElementCatalog make_catalog() {
    ElementCatalog catalog;
    catalog.mature_seqs["hsa-miR-122-5p"] = "UGGAGUGUGACAAUGGUGUUUG";
    catalog.mature_seqs["hsa-miR-1-3p"] = "UGGAAUGUAAAGAAGUAUGUAU";
    catalog.mature_seqs["hsa-miR-142-3p"] = "UGUAGUGUUUCCUACUUUAUGGA";
    catalog.mature_seqs["hsa-miR-9-5p"] = "UCUUUGGUUAUCUAGCUGUAUGA";
    for (const auto& [id, seq] : catalog.mature_seqs) {
        catalog.seeds[id] = seq.substr(1, 7);
    }
    return catalog;
}

DesignConfig make_config() {
    DesignConfig config;
    config.targets = {"Liver"};
    config.num_sites = 6;
    return config;
}

// ============================================================================
// Fold target names
// ============================================================================

void test_fold_target_names() {
    print_test_header("fold target names");

    check_result("cassette", parse_fold_target("cassette") == FoldTarget::kCassette);
    check_result("utr3", parse_fold_target("utr3") == FoldTarget::kUtr3);
    check_result("full", parse_fold_target("full") == FoldTarget::kFull);
    check_result("none", parse_fold_target("none") == FoldTarget::kNone);
    check_result("name round trip",
                 std::string(fold_target_name(parse_fold_target("utr3"))) == "utr3");

    bool threw = false;
    try {
        parse_fold_target("hairpin");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check_result("unknown name rejected", threw);
}

// ============================================================================
// In-memory design
// ============================================================================

void test_design_in_memory() {
    print_test_header("design (in memory)");

    DesignPipeline pipeline(make_config());
    DesignResult result = pipeline.run(make_matrix(), make_catalog());

    const auto& sel = result.selection;
    check_result("off-targets default to all others",
                 sel.all_off_targets == CellSet({"Blood", "Brain", "Heart", "Muscle"}));
    check_result("122 is not a candidate", sel.candidate_count == 3);
    check_result("selection order",
                 sel.selected == std::vector<std::string>({"hsa-miR-1-3p", "hsa-miR-142-3p"}));
    check_result("brain below cover threshold", sel.uncovered == CellSet({"Brain"}));
    check_result("not success", !sel.success);

    check_result("one site per step", result.sites.size() == 2);
    check_result("site ids follow selection", result.sites[0].element_id == "hsa-miR-1-3p");

    const auto& assembly = result.assembly;
    check_result("6 site slots", find_regions(assembly, RegionType::kSite).size() == 6);
    check_result("5 spacers", find_regions(assembly, RegionType::kSpacer).size() == 5);
    check_result("no context", assembly.full_sequence == assembly.utr3);
    check_result("utr3 GC reported",
                 result.utr3_gc > 0.0 && std::abs(result.utr3_gc - gc_content(assembly.utr3)) < 1e-12);

    check_result("cassette folded", result.has_fold);
    check_result("fold offset is cassette offset", result.fold_offset == cassette_offset(assembly));
    check_result("fold covers cassette", result.fold.sequence.size() == assembly.cassette.size());
    bool in_range = true;
    for (const auto& [i, j] : result.fold.pairs) {
        if (i < result.fold_offset || j >= result.fold_offset + assembly.cassette.size()) {
            in_range = false;
        }
    }
    check_result("pairs in full-sequence coordinates", in_range);
    check_result("nothing written without prefix", result.written_files.empty());
}

void test_fold_targets() {
    print_test_header("fold targets");

    DesignConfig config = make_config();
    config.fold_target = FoldTarget::kUtr3;
    DesignResult utr3 = DesignPipeline(config).run(make_matrix(), make_catalog());
    check_result("utr3 folded", utr3.has_fold && utr3.fold.sequence.size() == utr3.assembly.utr3.size());
    check_result("utr3 offset 0 without context", utr3.fold_offset == 0);

    config.fold_target = FoldTarget::kNone;
    DesignResult none = DesignPipeline(config).run(make_matrix(), make_catalog());
    check_result("no fold", !none.has_fold);

    config.fold_target = FoldTarget::kFull;
    config.fold.max_length = 50;
    DesignResult skipped = DesignPipeline(config).run(make_matrix(), make_catalog());
    check_result("too long: fold skipped", !skipped.has_fold);
    check_result("too long: assembly kept", !skipped.assembly.utr3.empty());
}

void test_no_candidates() {
    print_test_header("no candidates");

    DesignConfig config = make_config();
    config.cover_threshold = 1e9;
    DesignResult result = DesignPipeline(config).run(make_matrix(), make_catalog());

    check_result("nothing selected", result.selection.selected.empty());
    check_result("no sites", result.sites.empty());
    check_result("empty assembly", result.assembly.full_sequence.empty());
    check_result("no fold", !result.has_fold);
}

void test_missing_mature_sequence() {
    print_test_header("missing mature sequence");

    ElementCatalog catalog = make_catalog();
    catalog.mature_seqs.erase("hsa-miR-1-3p");

    DesignResult result = DesignPipeline(make_config()).run(make_matrix(), catalog);
    check_result("selection unchanged", result.selection.selected.size() == 2);
    check_result("site skipped", result.sites.size() == 1 &&
                                     result.sites[0].element_id == "hsa-miR-142-3p");
}

void test_single_and_multi_target_selection() {
    print_test_header("single / multi target selection");

    const ExpressionMatrix matrix = make_matrix();
    const ElementCatalog catalog = make_catalog();

    DesignPipeline single(make_config());
    SelectionParams params;
    params.targets = {"Liver"};
    params.off_targets = complement_cell_types(matrix, params.targets);
    const SelectionResult direct = select_elements(matrix, catalog, params);
    const SelectionResult via_pipeline = single.select(matrix, catalog);
    check_result("single target matches complement selection",
                 via_pipeline.selected == direct.selected &&
                     via_pipeline.all_off_targets == direct.all_off_targets);

    DesignConfig multi = make_config();
    multi.targets = {"Liver", "Brain"};
    const SelectionResult both = DesignPipeline(multi).select(matrix, catalog);
    check_result("both targets protected", both.all_off_targets == CellSet({"Blood", "Heart", "Muscle"}));
    check_result("9-5p loud in Brain is excluded",
                 std::find(both.selected.begin(), both.selected.end(), "hsa-miR-9-5p") ==
                     both.selected.end());

    DesignConfig explicit_off = make_config();
    explicit_off.off_targets = {"Blood"};
    const SelectionResult blood = DesignPipeline(explicit_off).select(matrix, catalog);
    check_result("explicit off-targets kept",
                 blood.success && blood.selected == std::vector<std::string>({"hsa-miR-142-3p"}));
}

void test_unknown_target() {
    print_test_header("unknown target");

    DesignConfig config = make_config();
    config.targets = {"Pancreas"};
    bool threw = false;
    try {
        DesignPipeline(config).run(make_matrix(), make_catalog());
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check_result("rejected", threw);
}

// ============================================================================
// File-based design
// ============================================================================

void test_design_from_files() {
    print_test_header("design from files");

    const std::string dir = make_temp_dir("sponge_test_pipeline");
    DesignConfig config = make_config();
    config.off_targets = {"Heart", "Blood"};
    config.matrix_path = write_text_file(dir, "means.csv",
        "miRNA,Liver,Heart,Blood\n"
        "hsa-miR-1-3p,2,12000,0\n"
        "hsa-miR-142-3p,5,0,30000\n");
    config.catalog_path = write_text_file(dir, "mature.fa",
        ">hsa-miR-1-3p\nTGGAATGTAAAGAAGTATGTAT\n"
        ">hsa-miR-142-3p\nTGTAGTGTTTCCTACTTTATGGA\n");
    config.cds_fasta_path = write_text_file(dir, "cds.fa", ">cds\nATGGTGAGCAAGGGCGAG\n");
    config.output_prefix = (std::filesystem::path(dir) / "design").string();

    DesignPipeline pipeline(config);
    DesignResult result = pipeline.run();

    check_result("success", result.selection.success);
    check_result("cds context", result.assembly.cds == "auggugagcaagggcgag");
    check_result("full = cds + utr3",
                 result.assembly.full_sequence == result.assembly.cds + result.assembly.utr3);
    check_result("5 files written", result.written_files.size() == 5);

    const std::string selection = read_text_file(config.output_prefix + ".selection.tsv");
    check_result("selection table", selection.find("#success=true") != std::string::npos &&
                                        selection.find("hsa-miR-142-3p") != std::string::npos);

    const std::string regions = read_text_file(config.output_prefix + ".regions.tsv");
    check_result("regions table", regions.rfind("type\tstart\tend", 0) == 0 &&
                                      regions.find("\ncds\t0\t18\t") != std::string::npos);

    const std::string fasta = read_text_file(config.output_prefix + ".fa");
    check_result("fasta records", fasta.find(">sponge_utr3\n") != std::string::npos &&
                                      fasta.find(">sponge_full\n") != std::string::npos);

    const std::string dbn = read_text_file(config.output_prefix + ".dbn");
    check_result("dot-bracket file", dbn.rfind(">sponge_cassette", 0) == 0);

    const std::string sites = read_text_file(config.output_prefix + ".sites.tsv");
    check_result("sites table with duplex", sites.find("# 5' ") != std::string::npos);

    DesignConfig no_matrix = make_config();
    bool threw = false;
    try {
        DesignPipeline(no_matrix).run();
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check_result("matrix required", threw);
}

int main() {
    std::cout << "=== SPONGE Design Pipeline Tests ===\n";

    try {
        test_fold_target_names();
        test_design_in_memory();
        test_fold_targets();
        test_no_candidates();
        test_missing_mature_sequence();
        test_single_and_multi_target_selection();
        test_unknown_target();
        test_design_from_files();

        std::cout << "\n=== All design pipeline tests passed! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
