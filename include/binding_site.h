#ifndef SPONGE_BINDING_SITE_H
#define SPONGE_BINDING_SITE_H

#include "coverage_selector.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sponge {

// ============================================================================
// Site layout constants
// ============================================================================

constexpr size_t kSeedMatchLength = 8;
constexpr size_t kBulgeLength = 4;
// Shortest element that still leaves a non-empty 3' match
constexpr size_t kMinElementLength = kSeedMatchLength + kBulgeLength + 1;

/**
 * Bulged binding site for one element.
 * site_seq = three_prime_match + bulge_mismatch + seed_match (5'->3' on the
 * site strand, antiparallel to the element).
 */
struct BindingSite {
    std::string element_id;
    std::string element_seq;        // normalised upper-case RNA
    std::string site_seq;
    std::string seed_match;         // 8 nt, perfect complement
    std::string bulge_mismatch;     // 4 nt, never complementary
    std::string three_prime_match;  // remaining nt
};

/**
 * Build the bulged site for a mature element sequence.
 *
 * Normalises to RNA, takes the reverse complement, keeps the last 8 nt as the
 * seed match, mutates the preceding 4 nt (A->C, U->G, G->U, C->A) into a
 * bulge and keeps the rest as the 3' match.
 *
 * Throws std::invalid_argument if the sequence is shorter than
 * kMinElementLength or contains letters outside ACGUT.
 */
BindingSite synthesize_site(const std::string& element_id, std::string_view mature_seq);

// Sites for the selected steps, in selection order.
std::vector<BindingSite> synthesize_sites(const std::vector<SelectionStep>& steps);

// ids may be shorter than seqs; missing ids become "miRNA-<n>".
std::vector<BindingSite> synthesize_sites(const std::vector<std::string>& ids,
                                          const std::vector<std::string>& seqs);

// Fixed bulge substitution, identity for unknown letters.
char bulge_substitute(char base);

// ============================================================================
// Duplex drawing
// ============================================================================

/**
 * Element 5'->3' over the reversed site 3'->5'.
 * bonds: '|' Watson-Crick, ':' G-U wobble, ' ' mismatch.
 */
struct DuplexAlignment {
    std::string element;
    std::string bonds;
    std::string site;
};

DuplexAlignment build_duplex(const BindingSite& site);

}  // namespace sponge

#endif  // SPONGE_BINDING_SITE_H
