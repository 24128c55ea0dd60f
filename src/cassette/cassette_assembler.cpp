#include "cassette_assembler.h"
#include "sequence_utils.h"

#include <stdexcept>
#include <utility>

namespace sponge {

const char* region_type_name(RegionType type) {
    switch (type) {
        case RegionType::kUtr5: return "utr5";
        case RegionType::kCds: return "cds";
        case RegionType::kStopCodon: return "stop";
        case RegionType::kLeadIn: return "lead_in";
        case RegionType::kSite: return "site";
        case RegionType::kSpacer: return "spacer";
        case RegionType::kLeadOut: return "lead_out";
        case RegionType::kPolyA: return "poly_a";
    }
    return "unknown";
}

namespace {

// Running cursor over the regions being emitted
class RegionEmitter {
public:
    explicit RegionEmitter(AssemblyResult& out) : out_(out) {}

    Region& emit(RegionType type, std::string_view seq) {
        Region region;
        region.type = type;
        region.start = out_.full_sequence.size();
        region.end = region.start + seq.size();
        region.seq = std::string(seq);
        out_.full_sequence.append(seq);
        out_.regions.push_back(std::move(region));
        return out_.regions.back();
    }

private:
    AssemblyResult& out_;
};

}  // namespace

AssemblyResult assemble_cassette(const std::vector<BindingSite>& sites,
                                 int32_t num_sites,
                                 const LeadingContext& context) {
    if (num_sites < 0) {
        throw std::invalid_argument("num_sites must be >= 0, got " +
                                    std::to_string(num_sites));
    }

    AssemblyResult result;
    if (sites.empty()) {
        return result;
    }

    result.sites = sites;
    result.num_sites = num_sites;
    RegionEmitter emitter(result);

    // Context: lower case, verbatim otherwise
    result.utr5 = normalize_rna_lower(context.utr5);
    result.cds = normalize_rna_lower(context.cds);
    if (!result.utr5.empty()) emitter.emit(RegionType::kUtr5, result.utr5);
    if (!result.cds.empty()) emitter.emit(RegionType::kCds, result.cds);

    const size_t utr3_start = result.full_sequence.size();

    emitter.emit(RegionType::kStopCodon, literals::kStopCodon);
    emitter.emit(RegionType::kLeadIn, literals::kLeadIn);

    const size_t k = sites.size();
    for (int32_t i = 0; i < num_sites; ++i) {
        const size_t idx = static_cast<size_t>(i) % k;
        const BindingSite& site = sites[idx];

        Region& region = emitter.emit(RegionType::kSite, site.site_seq);
        region.element_id = site.element_id;
        region.element_index = static_cast<int32_t>(idx);
        result.cassette += site.site_seq;

        if (i < num_sites - 1) {
            const auto spacer = literals::kSpacers[static_cast<size_t>(i) % literals::kSpacers.size()];
            emitter.emit(RegionType::kSpacer, spacer);
            result.cassette.append(spacer);
        }
    }

    emitter.emit(RegionType::kLeadOut, literals::kLeadOut);
    emitter.emit(RegionType::kPolyA, literals::kPolyASignal);

    result.utr3 = result.full_sequence.substr(utr3_start);
    return result;
}

std::vector<const Region*> find_regions(const AssemblyResult& result, RegionType type) {
    std::vector<const Region*> found;
    for (const auto& region : result.regions) {
        if (region.type == type) found.push_back(&region);
    }
    return found;
}

size_t cassette_offset(const AssemblyResult& result) {
    for (const auto& region : result.regions) {
        if (region.type == RegionType::kSite) return region.start;
    }
    return 0;
}

}  // namespace sponge
