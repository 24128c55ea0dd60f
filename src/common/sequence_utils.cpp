#include "sequence_utils.h"

#include <algorithm>
#include <cctype>

namespace sponge {

std::string normalize_rna(std::string_view seq) {
    std::string out;
    out.reserve(seq.size());
    for (char c : seq) {
        char u = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        out.push_back(u == 'T' ? 'U' : u);
    }
    return out;
}

std::string normalize_rna_lower(std::string_view seq) {
    std::string out = normalize_rna(seq);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool is_valid_rna(std::string_view seq) {
    return std::all_of(seq.begin(), seq.end(), [](char c) {
        return RnaCode::from_ascii(c) != RnaCode::INVALID;
    });
}

char complement_base(char base) {
    switch (base) {
        case 'A': return 'U';
        case 'U': return 'A';
        case 'G': return 'C';
        case 'C': return 'G';
        default: return base;
    }
}

std::string reverse_complement(std::string_view seq) {
    std::string rc;
    rc.reserve(seq.size());
    for (auto it = seq.rbegin(); it != seq.rend(); ++it) {
        rc.push_back(complement_base(*it));
    }
    return rc;
}

bool is_watson_crick(char a, char b) {
    const uint8_t x = RnaCode::from_ascii(a);
    const uint8_t y = RnaCode::from_ascii(b);
    if (x == RnaCode::INVALID || y == RnaCode::INVALID) return false;
    // A(0)+U(3) and C(1)+G(2) both sum to 3
    return x + y == 3;
}

bool can_pair(char a, char b) {
    if (is_watson_crick(a, b)) return true;
    const uint8_t x = RnaCode::from_ascii(a);
    const uint8_t y = RnaCode::from_ascii(b);
    return (x == RnaCode::G && y == RnaCode::U) ||
           (x == RnaCode::U && y == RnaCode::G);
}

double gc_content(std::string_view seq) {
    size_t valid = 0;
    size_t gc = 0;
    for (char c : seq) {
        const uint8_t code = RnaCode::from_ascii(c);
        if (code == RnaCode::INVALID) continue;
        ++valid;
        if (code == RnaCode::G || code == RnaCode::C) ++gc;
    }
    return valid > 0 ? static_cast<double>(gc) / static_cast<double>(valid) : 0.0;
}

}  // namespace sponge
