#ifndef SPONGE_CLI_OPTIONS_H
#define SPONGE_CLI_OPTIONS_H

#include "design_pipeline.h"

#include <cstdint>
#include <string>
#include <vector>

namespace sponge {

// ============================================================================
// Command line
// ============================================================================

struct CliOptions {
    std::string command;
    DesignConfig design;

    // fold / site (site takes repeated --seq / --id)
    std::vector<std::string> seqs;
    std::vector<std::string> element_ids;
    std::string fasta_path;
    std::string record_name;

    // rank
    std::string cell_type;
    double rank_threshold = 0.0;
    int32_t top_n = 10;

    bool help = false;
    bool version = false;
};

/**
 * Parse argv (argv[0] is skipped). Flags may appear before or after the
 * command. Throws std::invalid_argument on unknown options, missing values
 * and malformed or out-of-range numbers.
 */
CliOptions parse_args(int argc, char* argv[]);

// Whole-string numeric parsing; throws std::invalid_argument naming the flag
double parse_double(const std::string& flag, const std::string& value);
int64_t parse_int(const std::string& flag, const std::string& value);
int32_t parse_int32(const std::string& flag, const std::string& value);

}  // namespace sponge

#endif  // SPONGE_CLI_OPTIONS_H
