#include "binding_site.h"
#include "sequence_utils.h"

#include <algorithm>
#include <stdexcept>

namespace sponge {

char bulge_substitute(char base) {
    switch (base) {
        case 'A': return 'C';
        case 'U': return 'G';
        case 'G': return 'U';
        case 'C': return 'A';
        default: return base;
    }
}

BindingSite synthesize_site(const std::string& element_id, std::string_view mature_seq) {
    if (!is_valid_rna(mature_seq)) {
        throw std::invalid_argument(
            "Element " + element_id + " has a non-nucleotide character in '" +
            std::string(mature_seq) + "'");
    }
    if (mature_seq.size() < kMinElementLength) {
        throw std::invalid_argument(
            "Element " + element_id + " sequence too short (" +
            std::to_string(mature_seq.size()) + " nt): at least " +
            std::to_string(kMinElementLength) +
            " nt are needed for seed, bulge and 3' match regions");
    }

    BindingSite site;
    site.element_id = element_id;
    site.element_seq = normalize_rna(mature_seq);

    const std::string rc = reverse_complement(site.element_seq);
    const size_t n = rc.size();
    const size_t seed_start = n - kSeedMatchLength;
    const size_t bulge_start = seed_start - kBulgeLength;

    site.seed_match = rc.substr(seed_start);
    site.three_prime_match = rc.substr(0, bulge_start);

    site.bulge_mismatch = rc.substr(bulge_start, kBulgeLength);
    std::transform(site.bulge_mismatch.begin(), site.bulge_mismatch.end(),
                   site.bulge_mismatch.begin(), bulge_substitute);

    site.site_seq = site.three_prime_match + site.bulge_mismatch + site.seed_match;
    return site;
}

std::vector<BindingSite> synthesize_sites(const std::vector<SelectionStep>& steps) {
    std::vector<BindingSite> sites;
    sites.reserve(steps.size());
    for (const auto& step : steps) {
        sites.push_back(synthesize_site(step.element_id, step.mature_seq));
    }
    return sites;
}

std::vector<BindingSite> synthesize_sites(const std::vector<std::string>& ids,
                                          const std::vector<std::string>& seqs) {
    std::vector<BindingSite> sites;
    sites.reserve(seqs.size());
    for (size_t i = 0; i < seqs.size(); ++i) {
        std::string id = (i < ids.size() && !ids[i].empty())
            ? ids[i]
            : "miRNA-" + std::to_string(i + 1);
        sites.push_back(synthesize_site(id, seqs[i]));
    }
    return sites;
}

DuplexAlignment build_duplex(const BindingSite& site) {
    DuplexAlignment aln;
    std::string site_rev(site.site_seq.rbegin(), site.site_seq.rend());

    const size_t len = std::max(site.element_seq.size(), site_rev.size());
    aln.element.reserve(len);
    aln.bonds.reserve(len);
    aln.site.reserve(len);

    for (size_t i = 0; i < len; ++i) {
        const char m = i < site.element_seq.size() ? site.element_seq[i] : ' ';
        const char s = i < site_rev.size() ? site_rev[i] : ' ';
        aln.element.push_back(m);
        aln.site.push_back(s);
        if (is_watson_crick(m, s)) {
            aln.bonds.push_back('|');
        } else if (can_pair(m, s)) {
            aln.bonds.push_back(':');
        } else {
            aln.bonds.push_back(' ');
        }
    }
    return aln;
}

}  // namespace sponge
