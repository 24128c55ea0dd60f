#include "cli_options.h"

#include <cstddef>
#include <limits>
#include <stdexcept>

namespace sponge {

namespace {

// Value of an option that needs one, advancing i
std::string take_value(int argc, char* argv[], int& i) {
    const std::string flag = argv[i];
    if (i + 1 >= argc) {
        throw std::invalid_argument("Missing value for " + flag);
    }
    return argv[++i];
}

}  // namespace

double parse_double(const std::string& flag, const std::string& value) {
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid number for " + flag + ": " + value);
    }
    if (used != value.size()) {
        throw std::invalid_argument("Invalid number for " + flag + ": " + value);
    }
    return v;
}

int64_t parse_int(const std::string& flag, const std::string& value) {
    size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid integer for " + flag + ": " + value);
    }
    if (used != value.size()) {
        throw std::invalid_argument("Invalid integer for " + flag + ": " + value);
    }
    return static_cast<int64_t>(v);
}

int32_t parse_int32(const std::string& flag, const std::string& value) {
    const int64_t v = parse_int(flag, value);
    if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) {
        throw std::invalid_argument("Integer out of range for " + flag + ": " + value);
    }
    return static_cast<int32_t>(v);
}

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;
    DesignConfig& cfg = opts.design;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--version") {
            opts.version = true;
        } else if (arg == "-v" || arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--matrix") {
            cfg.matrix_path = take_value(argc, argv, i);
        } else if (arg == "--samples") {
            cfg.samples_path = take_value(argc, argv, i);
        } else if (arg == "--metadata") {
            cfg.metadata_path = take_value(argc, argv, i);
        } else if (arg == "--catalog") {
            cfg.catalog_path = take_value(argc, argv, i);
        } else if (arg == "--seed-map") {
            cfg.seed_map_path = take_value(argc, argv, i);
        } else if (arg == "--species") {
            cfg.species_id = parse_int32(arg, take_value(argc, argv, i));
        } else if (arg == "--target") {
            cfg.targets.insert(take_value(argc, argv, i));
        } else if (arg == "--off-target") {
            cfg.off_targets.insert(take_value(argc, argv, i));
        } else if (arg == "--target-thresh") {
            cfg.target_threshold = parse_double(arg, take_value(argc, argv, i));
        } else if (arg == "--cover-thresh") {
            cfg.cover_threshold = parse_double(arg, take_value(argc, argv, i));
        } else if (arg == "--max-elements") {
            cfg.max_elements = parse_int32(arg, take_value(argc, argv, i));
        } else if (arg == "--min-expression") {
            cfg.aggregation.min_max_expression = parse_double(arg, take_value(argc, argv, i));
        } else if (arg == "--num-sites") {
            cfg.num_sites = parse_int32(arg, take_value(argc, argv, i));
        } else if (arg == "--utr5") {
            cfg.utr5_fasta_path = take_value(argc, argv, i);
        } else if (arg == "--cds") {
            cfg.cds_fasta_path = take_value(argc, argv, i);
        } else if (arg == "--fold") {
            cfg.fold_target = parse_fold_target(take_value(argc, argv, i));
        } else if (arg == "--max-fold-length") {
            const int64_t n = parse_int(arg, take_value(argc, argv, i));
            if (n < 0) {
                throw std::invalid_argument("--max-fold-length must be >= 0");
            }
            cfg.fold.max_length = static_cast<size_t>(n);
        } else if (arg == "--out") {
            cfg.output_prefix = take_value(argc, argv, i);
        } else if (arg == "--cell-type") {
            opts.cell_type = take_value(argc, argv, i);
        } else if (arg == "--threshold") {
            opts.rank_threshold = parse_double(arg, take_value(argc, argv, i));
        } else if (arg == "--top") {
            opts.top_n = parse_int32(arg, take_value(argc, argv, i));
            if (opts.top_n < 0) {
                throw std::invalid_argument("--top must be >= 0");
            }
        } else if (arg == "--seq") {
            opts.seqs.push_back(take_value(argc, argv, i));
        } else if (arg == "--fasta") {
            opts.fasta_path = take_value(argc, argv, i);
        } else if (arg == "--name") {
            opts.record_name = take_value(argc, argv, i);
        } else if (arg == "--id") {
            opts.element_ids.push_back(take_value(argc, argv, i));
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }
    return opts;
}

}  // namespace sponge
