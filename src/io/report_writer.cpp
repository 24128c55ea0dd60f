#include "report_writer.h"

#include <iomanip>
#include <ios>
#include <stdexcept>

namespace sponge {

namespace {

// Restores the caller's number formatting on scope exit
class StreamFormatGuard {
public:
    explicit StreamFormatGuard(std::ostream& os)
        : os_(os), flags_(os.flags()), precision_(os.precision()) {}
    ~StreamFormatGuard() {
        os_.flags(flags_);
        os_.precision(precision_);
    }

    StreamFormatGuard(const StreamFormatGuard&) = delete;
    StreamFormatGuard& operator=(const StreamFormatGuard&) = delete;

private:
    std::ostream& os_;
    std::ios_base::fmtflags flags_;
    std::streamsize precision_;
};

}  // namespace

std::string join_cells(const CellSet& cells) {
    std::string out;
    for (const auto& c : cells) {
        if (!out.empty()) out += ',';
        out += c;
    }
    return out;
}

void write_selection_table(std::ostream& os, const SelectionResult& result) {
    StreamFormatGuard guard(os);
    const size_t n_off = result.all_off_targets.size();
    const size_t n_covered = n_off - result.uncovered.size();

    os << std::fixed << std::setprecision(2);
    os << "#success=" << (result.success ? "true" : "false") << "\n";
    os << "#candidates=" << result.candidate_count << "\n";
    os << "#selected=" << result.selected.size() << "\n";
    os << "#covered=" << n_covered << "/" << n_off << "\n";
    os << "#covered_fraction=" << result.covered_fraction() << "\n";
    if (!result.uncovered.empty()) {
        os << "#uncovered=" << join_cells(result.uncovered) << "\n";
    }

    os << "step\telement_id\tseed\ttarget_mean\tn_covered\tnewly_covered\tmature_seq\n";
    for (size_t i = 0; i < result.steps.size(); ++i) {
        const auto& step = result.steps[i];
        os << (i + 1) << "\t"
           << step.element_id << "\t"
           << (step.seed.empty() ? "?" : step.seed) << "\t"
           << step.mean_target_value << "\t"
           << step.newly_covered.size() << "\t"
           << join_cells(step.newly_covered) << "\t"
           << (step.mature_seq.empty() ? "?" : step.mature_seq) << "\n";
    }
}

void write_ranking_table(std::ostream& os, const std::string& cell_type, double threshold,
                         const std::vector<RankedElement>& ranked) {
    StreamFormatGuard guard(os);
    os << std::fixed << std::setprecision(2);
    os << "#cell_type=" << cell_type << "\n";
    os << "#threshold=" << threshold << "\n";
    os << "#reported=" << ranked.size() << "\n";
    os << "element_id\tmature_seq\tmean_expr\tentropy\n";
    for (const auto& row : ranked) {
        os << row.element_id << "\t"
           << (row.mature_seq.empty() ? "?" : row.mature_seq) << "\t"
           << std::setprecision(2) << row.mean << "\t"
           << std::setprecision(4) << row.entropy << "\n";
    }
}

void write_region_table(std::ostream& os, const AssemblyResult& assembly) {
    os << "type\tstart\tend\telement_id\telement_index\tseq\n";
    for (const auto& region : assembly.regions) {
        os << region_type_name(region.type) << "\t"
           << region.start << "\t"
           << region.end << "\t"
           << (region.element_id.empty() ? "." : region.element_id) << "\t";
        if (region.element_index >= 0) {
            os << region.element_index;
        } else {
            os << ".";
        }
        os << "\t" << region.seq << "\n";
    }
}

void write_site_table(std::ostream& os, const std::vector<BindingSite>& sites) {
    os << "element_id\telement_seq\tsite_seq\tthree_prime_match\tbulge_mismatch\tseed_match\n";
    for (const auto& site : sites) {
        os << site.element_id << "\t"
           << site.element_seq << "\t"
           << site.site_seq << "\t"
           << site.three_prime_match << "\t"
           << site.bulge_mismatch << "\t"
           << site.seed_match << "\n";
    }
    // duplex drawings as comments
    for (const auto& site : sites) {
        const auto duplex = build_duplex(site);
        os << "# " << site.element_id << "\n";
        os << "# 5' " << duplex.element << " 3' element\n";
        os << "#    " << duplex.bonds << "\n";
        os << "# 3' " << duplex.site << " 5' site\n";
    }
}

void write_fasta_record(std::ostream& os, const std::string& name,
                        const std::string& sequence, size_t line_width) {
    os << ">" << name << "\n";
    if (line_width == 0) {
        os << sequence << "\n";
        return;
    }
    for (size_t pos = 0; pos < sequence.size(); pos += line_width) {
        os << sequence.substr(pos, line_width) << "\n";
    }
}

void write_dot_bracket(std::ostream& os, const std::string& name, const FoldResult& fold) {
    os << ">" << name << "\n";
    os << fold.sequence << "\n";
    os << fold.dot_bracket << " (" << fold.num_pairs() << ")\n";
}

ReportWriter::ReportWriter(const std::string& path) : path_(path), ofs_(path) {
    if (!ofs_.is_open()) {
        throw std::runtime_error("Cannot open for writing: " + path);
    }
}

}  // namespace sponge
