#ifndef SPONGE_SEQUENCE_UTILS_H
#define SPONGE_SEQUENCE_UTILS_H

#include <cstdint>
#include <string>
#include <string_view>

namespace sponge {

// ============================================================================
// Nucleotide encoding
// ============================================================================

/**
 * 2-bit RNA code
 * A=0, C=1, G=2, U=3 (T is read as U), anything else = INVALID
 */
struct RnaCode {
    static constexpr uint8_t A = 0;
    static constexpr uint8_t C = 1;
    static constexpr uint8_t G = 2;
    static constexpr uint8_t U = 3;
    static constexpr uint8_t INVALID = 4;

    static uint8_t from_ascii(char c) {
        switch (c) {
            case 'A': case 'a': return A;
            case 'C': case 'c': return C;
            case 'G': case 'g': return G;
            case 'U': case 'u':
            case 'T': case 't': return U;
            default: return INVALID;
        }
    }
};

// ============================================================================
// Sequence helpers
// ============================================================================

// Upper-case RNA, legacy DNA T mapped to U. Other characters pass through.
std::string normalize_rna(std::string_view seq);

// Lower-case RNA, used for pass-through context.
std::string normalize_rna_lower(std::string_view seq);

// True when every character is one of ACGUT (any case).
bool is_valid_rna(std::string_view seq);

// Watson-Crick complement on the RNA alphabet (A<->U, G<->C).
// Unknown characters are returned unchanged.
char complement_base(char base);

// Reverse complement of an upper-case RNA sequence.
std::string reverse_complement(std::string_view seq);

/**
 * Pairing rule shared by the synthesizer checks, the duplex drawing and the
 * structure estimator: Watson-Crick (A-U, G-C) or G-U wobble.
 * Case-insensitive, T counts as U.
 */
bool can_pair(char a, char b);

// Watson-Crick only (no wobble).
bool is_watson_crick(char a, char b);

// G+C fraction over valid bases, 0.0 for an empty sequence.
double gc_content(std::string_view seq);

}  // namespace sponge

#endif  // SPONGE_SEQUENCE_UTILS_H
