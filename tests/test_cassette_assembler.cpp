#include <cassert>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "binding_site.h"
#include "cassette_assembler.h"

using namespace sponge;

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

std::vector<BindingSite> make_sites() {
    return synthesize_sites({"miR-a", "miR-b", "miR-c"},
                            {"UGAGGUAGUAGGUUGUAUAGUU",
                             "UAGCUUAUCAGACUGAUGUUGA",
                             "ACGUACGUACGUA"});
}

// Regions cover [0, n) contiguously and each region's seq is its slice
bool regions_tile(const AssemblyResult& result) {
    size_t cursor = 0;
    for (const auto& region : result.regions) {
        if (region.start != cursor) return false;
        if (region.end < region.start) return false;
        if (region.seq != result.full_sequence.substr(region.start, region.length())) {
            return false;
        }
        cursor = region.end;
    }
    return cursor == result.full_sequence.size();
}

bool all_lower(const std::string& s) {
    for (char c : s) {
        if (std::isupper(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// ============================================================================
// Constants
// ============================================================================

void test_literals() {
    print_test_header("fixed literals");

    check_result("stop codon", literals::kStopCodon == "UAA");
    check_result("lead-in", literals::kLeadIn == "gcauac");
    check_result("lead-out", literals::kLeadOut == "gauc");
    check_result("16 spacers", literals::kSpacers.size() == 16);
    bool four_nt = true;
    for (const auto& sp : literals::kSpacers) {
        if (sp.size() != 4) four_nt = false;
    }
    check_result("spacers are 4 nt", four_nt);
    check_result("poly-A signal length", literals::kPolyASignal.size() == 263);

    check_result("region names",
                 std::string(region_type_name(RegionType::kSite)) == "site" &&
                 std::string(region_type_name(RegionType::kPolyA)) == "poly_a" &&
                 std::string(region_type_name(RegionType::kStopCodon)) == "stop");
}

// ============================================================================
// Cycling
// ============================================================================

void test_single_site_three_slots() {
    print_test_header("3 slots, 1 distinct site");

    auto sites = synthesize_sites({"miR-1"}, {"ACGUACGUACGUA"});
    AssemblyResult result = assemble_cassette(sites, 3);

    auto site_regions = find_regions(result, RegionType::kSite);
    auto spacer_regions = find_regions(result, RegionType::kSpacer);

    check_result("3 site regions", site_regions.size() == 3);
    check_result("2 spacer regions", spacer_regions.size() == 2);

    bool same_element = true;
    for (const auto* r : site_regions) {
        if (r->element_id != "miR-1" || r->element_index != 0) same_element = false;
    }
    check_result("all element index 0", same_element);
    check_result("num_sites kept", result.num_sites == 3);
}

void test_cycling_order() {
    print_test_header("site / spacer cycling");

    auto sites = make_sites();
    AssemblyResult result = assemble_cassette(sites, 20);

    auto site_regions = find_regions(result, RegionType::kSite);
    auto spacer_regions = find_regions(result, RegionType::kSpacer);

    check_result("20 sites", site_regions.size() == 20);
    check_result("19 spacers", spacer_regions.size() == 19);

    bool sites_cycle = true;
    for (size_t i = 0; i < site_regions.size(); ++i) {
        const auto& expected = sites[i % sites.size()];
        if (site_regions[i]->seq != expected.site_seq ||
            site_regions[i]->element_index != static_cast<int32_t>(i % sites.size())) {
            sites_cycle = false;
        }
    }
    check_result("site i uses sites[i % k]", sites_cycle);

    bool spacers_cycle = true;
    for (size_t i = 0; i < spacer_regions.size(); ++i) {
        if (spacer_regions[i]->seq != literals::kSpacers[i % literals::kSpacers.size()]) {
            spacers_cycle = false;
        }
    }
    check_result("spacer i uses pool[i % 16]", spacers_cycle);
    check_result("spacer 17 wraps", spacer_regions[16]->seq == "aauu");
}

// ============================================================================
// Layout
// ============================================================================

void test_utr3_layout() {
    print_test_header("3'UTR layout");

    auto sites = make_sites();
    AssemblyResult result = assemble_cassette(sites, 4);

    check_result("no context: full == utr3", result.full_sequence == result.utr3);
    check_result("starts with stop + lead-in", result.utr3.rfind("UAAgcauac", 0) == 0);

    const std::string tail = std::string(literals::kLeadOut) + std::string(literals::kPolyASignal);
    check_result("ends with lead-out + poly-A",
                 result.utr3.size() >= tail.size() &&
                 result.utr3.compare(result.utr3.size() - tail.size(), tail.size(), tail) == 0);

    const std::string expected_cassette =
        sites[0].site_seq + "aauu" + sites[1].site_seq + "ucga" +
        sites[2].site_seq + "caag" + sites[0].site_seq;
    check_result("cassette", result.cassette == expected_cassette);
    check_result("utr3 composition",
                 result.utr3 == "UAAgcauac" + expected_cassette + tail);

    check_result("cassette offset", cassette_offset(result) == 9);
    check_result("regions tile", regions_tile(result));

    // emission order
    check_result("first region stop", result.regions.front().type == RegionType::kStopCodon);
    check_result("second region lead-in", result.regions[1].type == RegionType::kLeadIn);
    check_result("last region poly-A", result.regions.back().type == RegionType::kPolyA);
    check_result("lead-out before poly-A",
                 result.regions[result.regions.size() - 2].type == RegionType::kLeadOut);
}

void test_leading_context() {
    print_test_header("leading context");

    auto sites = make_sites();
    LeadingContext context;
    context.utr5 = "GGGAAAUAAGAGAGAAAAGAAGAGUAAGAAGAAAUAUAAGAGCCACC";
    context.cds = "AUGGTGAGCAAGGGCGAGGAG";

    AssemblyResult result = assemble_cassette(sites, 16, context);

    check_result("utr5 lower case", all_lower(result.utr5));
    check_result("cds lower case, T->U", result.cds == "auggugagcaagggcgaggag");
    check_result("full = utr5 + cds + utr3",
                 result.full_sequence == result.utr5 + result.cds + result.utr3);
    check_result("first regions are context",
                 result.regions[0].type == RegionType::kUtr5 &&
                 result.regions[1].type == RegionType::kCds);
    check_result("regions tile", regions_tile(result));
    check_result("cassette offset after context",
                 cassette_offset(result) == result.utr5.size() + result.cds.size() + 9);
    check_result("stop codon region",
                 find_regions(result, RegionType::kStopCodon).front()->start ==
                     result.utr5.size() + result.cds.size());

    LeadingContext cds_only;
    cds_only.cds = "AUGAAA";
    AssemblyResult no_utr5 = assemble_cassette(sites, 2, cds_only);
    check_result("no utr5 region", find_regions(no_utr5, RegionType::kUtr5).empty());
    check_result("cds region", find_regions(no_utr5, RegionType::kCds).size() == 1);
    check_result("regions tile (cds only)", regions_tile(no_utr5));
}

// ============================================================================
// Degenerate inputs
// ============================================================================

void test_empty_and_zero() {
    print_test_header("empty sites / zero slots");

    AssemblyResult empty = assemble_cassette({}, 16);
    check_result("empty sites: empty result",
                 empty.full_sequence.empty() && empty.regions.empty() && empty.utr3.empty());
    check_result("empty sites: offset 0", cassette_offset(empty) == 0);

    auto sites = make_sites();
    AssemblyResult zero = assemble_cassette(sites, 0);
    check_result("zero slots: no sites", find_regions(zero, RegionType::kSite).empty());
    check_result("zero slots: no spacers", find_regions(zero, RegionType::kSpacer).empty());
    check_result("zero slots: stop + lead-in + lead-out + poly-A",
                 zero.utr3 == "UAAgcauacgauc" + std::string(literals::kPolyASignal));
    check_result("zero slots: regions tile", regions_tile(zero));

    AssemblyResult one = assemble_cassette(sites, 1);
    check_result("one slot: no spacer", find_regions(one, RegionType::kSpacer).empty());

    bool threw = false;
    try {
        assemble_cassette(sites, -1);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check_result("negative slots rejected", threw);
}

int main() {
    std::cout << "=== SPONGE Cassette Assembler Tests ===\n";

    try {
        test_literals();
        test_single_site_three_slots();
        test_cycling_order();
        test_utr3_layout();
        test_leading_context();
        test_empty_and_zero();

        std::cout << "\n=== All cassette assembler tests passed! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
