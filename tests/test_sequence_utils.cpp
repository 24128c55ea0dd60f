#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "sequence_utils.h"

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

// ============================================================================
// Encoding
// ============================================================================

void test_rna_code() {
    print_test_header("RnaCode");

    check_result("A", RnaCode::from_ascii('A') == RnaCode::A);
    check_result("lower c", RnaCode::from_ascii('c') == RnaCode::C);
    check_result("T reads as U", RnaCode::from_ascii('T') == RnaCode::U);
    check_result("N invalid", RnaCode::from_ascii('N') == RnaCode::INVALID);
}

// ============================================================================
// Normalisation / complement
// ============================================================================

void test_normalize() {
    print_test_header("normalize_rna");

    check_result("upper + T->U", normalize_rna("acgTt") == "ACGUU");
    check_result("lower", normalize_rna_lower("ACGT") == "acgu");
    check_result("empty", normalize_rna("").empty());

    check_result("valid mixed case", is_valid_rna("AcGuT"));
    check_result("invalid N", !is_valid_rna("ACGN"));
    check_result("invalid space", !is_valid_rna("AC GU"));
    check_result("empty valid", is_valid_rna(""));
}

void test_reverse_complement() {
    print_test_header("reverse_complement");

    check_result("simple", reverse_complement("AACG") == "CGUU");
    check_result("palindrome", reverse_complement("GAUC") == "GAUC");
    check_result("double rc", reverse_complement(reverse_complement("UGAGGUAGUAGG")) ==
                                  "UGAGGUAGUAGG");
    check_result("complement_base unknown", complement_base('N') == 'N');
}

// ============================================================================
// Pairing rules
// ============================================================================

void test_pairing_rules() {
    print_test_header("can_pair / is_watson_crick");

    check_result("A-U", is_watson_crick('A', 'U') && is_watson_crick('U', 'A'));
    check_result("G-C", is_watson_crick('G', 'C') && is_watson_crick('c', 'g'));
    check_result("G-U not WC", !is_watson_crick('G', 'U'));
    check_result("G-U wobble", can_pair('G', 'U') && can_pair('U', 'G'));
    check_result("T as U", can_pair('A', 'T'));
    check_result("A-A", !can_pair('A', 'A'));
    check_result("A-G", !can_pair('A', 'G'));
    check_result("C-U", !can_pair('C', 'U'));
    check_result("N never pairs", !can_pair('N', 'N') && !can_pair('G', 'N'));
}

void test_gc_content() {
    print_test_header("gc_content");

    check_result("half", std::abs(gc_content("GCAU") - 0.5) < 1e-9);
    check_result("ignores invalid", std::abs(gc_content("GGNN") - 1.0) < 1e-9);
    check_result("empty", gc_content("") == 0.0);
}

int main() {
    std::cout << "=== SPONGE Sequence Utility Tests ===\n";

    try {
        test_rna_code();
        test_normalize();
        test_reverse_complement();
        test_pairing_rules();
        test_gc_content();

        std::cout << "\n=== All sequence utility tests passed! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
