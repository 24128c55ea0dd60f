#ifndef SPONGE_CASSETTE_ASSEMBLER_H
#define SPONGE_CASSETTE_ASSEMBLER_H

#include "binding_site.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sponge {

// ============================================================================
// Fixed building blocks
// ============================================================================

namespace literals {

inline constexpr std::string_view kStopCodon = "UAA";
inline constexpr std::string_view kLeadIn = "gcauac";
inline constexpr std::string_view kLeadOut = "gauc";

inline constexpr std::array<std::string_view, 16> kSpacers = {
    "aauu", "ucga", "caag", "auac", "gaau",
    "cuua", "uuca", "agcu", "uacg", "gaua",
    "cuac", "acuc", "uguu", "caua", "ucuu", "agau",
};

// Synthetic poly-A signal with upstream stabilising elements
inline constexpr std::string_view kPolyASignal =
    "CUCAGGUGCAGGCUGCCUAUCAGAAGGUGGUGGCUGGUGUGGCCAAUGCCCUGGCUCACAAAUACCACUGAGAUC"
    "UUUUUCCCUCUGCCAAAAAUUAUGGGGACAUCAUGAAGCCCCUUGAGCAUCUGACUUCUGGCUAAUAAAGGAAAU"
    "UUAUUUUCAUUGCAAUAGUGUGUUGGAAUUUUUUGUGUCUCUCACUCGGAAGGACAUAUGGGAGGGCAAAUCAUU"
    "UAAAACAUCAGAAUGAGUAUUUGGUUUAGAGUUUGGCA";

}  // namespace literals

constexpr int32_t kDefaultNumSites = 16;

// ============================================================================
// Regions
// ============================================================================

enum class RegionType : uint8_t {
    kUtr5 = 0,      // pass-through context
    kCds = 1,       // pass-through context
    kStopCodon = 2,
    kLeadIn = 3,    // 5' linker
    kSite = 4,
    kSpacer = 5,
    kLeadOut = 6,   // 3' linker
    kPolyA = 7      // terminal signal
};

const char* region_type_name(RegionType type);

struct Region {
    RegionType type = RegionType::kSite;
    size_t start = 0;   // half-open [start, end) in full_sequence
    size_t end = 0;
    std::string seq;

    // Site regions only
    std::string element_id;
    int32_t element_index = -1;

    size_t length() const { return end - start; }
};

struct LeadingContext {
    std::string utr5;
    std::string cds;

    bool empty() const { return utr5.empty() && cds.empty(); }
};

struct AssemblyResult {
    std::string full_sequence;   // context + utr3
    std::string utr3;            // stop codon .. poly-A
    std::string utr5;            // as emitted (lower case)
    std::string cds;             // as emitted (lower case)
    std::string cassette;        // sites + spacers only
    std::vector<BindingSite> sites;
    std::vector<Region> regions;
    int32_t num_sites = 0;
};

// ============================================================================
// Assembly
// ============================================================================

/**
 * Lay out context, stop codon, lead-in, num_sites sites (cycling over
 * `sites`) separated by spacers, lead-out and poly-A signal.
 *
 * Regions tile [0, full_sequence.size()) in emission order. Context is
 * emitted in lower case so it reads differently from the upper-case sites.
 * Empty `sites` gives an all-empty result. Throws std::invalid_argument for
 * num_sites < 0.
 */
AssemblyResult assemble_cassette(const std::vector<BindingSite>& sites,
                                 int32_t num_sites = kDefaultNumSites,
                                 const LeadingContext& context = {});

std::vector<const Region*> find_regions(const AssemblyResult& result, RegionType type);

// Start of the first site region in full_sequence, 0 when there is none.
size_t cassette_offset(const AssemblyResult& result);

}  // namespace sponge

#endif  // SPONGE_CASSETTE_ASSEMBLER_H
