#include "data_loader.h"
#include "fasta_reader.h"
#include "sequence_utils.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <execution>
#include <fstream>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <unordered_map>

namespace sponge {

namespace {

std::string lower_extension(const std::string& path) {
    const size_t slash = path.find_last_of("/\\");
    const size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return {};
    }
    std::string ext = path.substr(dot + 1);
    for (char& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::ifstream open_or_throw(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open " + path);
    }
    return in;
}

// Empty cell = 0 (pandas NaN is skipped by max/mean; 0 keeps the row sparse)
double parse_value(const std::string& field, const std::string& path, size_t line_no) {
    const std::string text = trim(field);
    if (text.empty()) return 0.0;

    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0' || errno == ERANGE) {
        throw std::runtime_error(path + ":" + std::to_string(line_no) +
                                 ": not a number: '" + text + "'");
    }
    if (std::isnan(v)) return 0.0;
    if (std::isinf(v) || v < 0.0) {
        throw std::runtime_error(path + ":" + std::to_string(line_no) +
                                 ": expression must be finite and non-negative: '" +
                                 text + "'");
    }
    return v;
}

int find_column(const std::vector<std::string>& header, const std::string& name) {
    for (size_t i = 0; i < header.size(); ++i) {
        if (trim(header[i]) == name) return static_cast<int>(i);
    }
    return -1;
}

int require_column(const std::vector<std::string>& header,
                   const std::string& name,
                   const std::string& path) {
    const int col = find_column(header, name);
    if (col < 0) {
        throw std::runtime_error(path + ": missing column '" + name + "'");
    }
    return col;
}

struct SampleRow {
    std::string element_id;
    std::vector<double> values;
};

}  // namespace

// ============================================================================
// Delimited text helpers
// ============================================================================

char delimiter_for(const std::string& path) {
    const std::string ext = lower_extension(path);
    return (ext == "tsv" || ext == "txt" || ext == "tab") ? '\t' : ',';
}

std::vector<std::string> split_fields(const std::string& line, char delim) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    size_t n = line.size();
    if (n > 0 && line[n - 1] == '\r') --n;

    for (size_t i = 0; i < n; ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < n && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == delim) {
            fields.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

// ============================================================================
// Expression matrices
// ============================================================================

ExpressionMatrix load_mean_matrix(const std::string& path) {
    std::ifstream in = open_or_throw(path);
    const char delim = delimiter_for(path);

    std::string line;
    if (!std::getline(in, line)) {
        throw std::runtime_error(path + ": empty file");
    }
    const auto header = split_fields(line, delim);
    if (header.size() < 2) {
        throw std::runtime_error(path + ": header needs an id column and at least one cell type");
    }

    std::vector<std::string> cell_types;
    for (size_t c = 1; c < header.size(); ++c) {
        cell_types.push_back(trim(header[c]));
    }

    ExpressionMatrix matrix;
    size_t line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) continue;

        const auto fields = split_fields(line, delim);
        if (fields.size() != header.size()) {
            throw std::runtime_error(path + ":" + std::to_string(line_no) + ": expected " +
                                     std::to_string(header.size()) + " fields, got " +
                                     std::to_string(fields.size()));
        }

        const std::string element_id = trim(fields[0]);
        matrix.add_element(element_id);
        for (size_t c = 1; c < fields.size(); ++c) {
            matrix.set(element_id, cell_types[c - 1], parse_value(fields[c], path, line_no));
        }
    }
    return matrix;
}

ExpressionMatrix aggregate_sample_matrix(const std::string& samples_path,
                                         const std::string& metadata_path,
                                         const AggregationConfig& config,
                                         const std::set<std::string>& known_ids,
                                         AggregationStats* stats) {
    AggregationStats local;

    // ------------------------------------------------------------------
    // Sample metadata: sample id -> cell type
    // ------------------------------------------------------------------
    std::unordered_map<std::string, std::string> sample_to_cell;
    {
        std::ifstream in = open_or_throw(metadata_path);
        const char delim = delimiter_for(metadata_path);
        std::string line;
        if (!std::getline(in, line)) {
            throw std::runtime_error(metadata_path + ": empty file");
        }
        const auto header = split_fields(line, delim);
        const int cell_col = require_column(header, config.cell_type_column, metadata_path);

        while (std::getline(in, line)) {
            if (trim(line).empty()) continue;
            const auto fields = split_fields(line, delim);
            if (static_cast<int>(fields.size()) <= cell_col) continue;
            const std::string label = trim(fields[cell_col]);
            if (label.empty()) continue;
            sample_to_cell[trim(fields[0])] = label;
        }
    }

    // ------------------------------------------------------------------
    // Sample matrix
    // ------------------------------------------------------------------
    std::ifstream in = open_or_throw(samples_path);
    const char delim = delimiter_for(samples_path);
    std::string line;
    if (!std::getline(in, line)) {
        throw std::runtime_error(samples_path + ": empty file");
    }
    const auto header = split_fields(line, delim);
    if (header.size() < 2) {
        throw std::runtime_error(samples_path + ": header needs an id column and at least one sample");
    }

    // column -> cell type group (-1 = unmapped)
    std::vector<std::string> group_names;
    std::unordered_map<std::string, int> group_index;
    std::vector<int> column_group(header.size() - 1, -1);
    for (size_t c = 1; c < header.size(); ++c) {
        auto it = sample_to_cell.find(trim(header[c]));
        if (it == sample_to_cell.end()) {
            ++local.unmapped_samples;
            continue;
        }
        auto [git, inserted] = group_index.try_emplace(it->second, static_cast<int>(group_names.size()));
        if (inserted) group_names.push_back(it->second);
        column_group[c - 1] = git->second;
    }
    local.input_samples = header.size() - 1;

    std::vector<SampleRow> rows;
    size_t line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) continue;
        const auto fields = split_fields(line, delim);
        if (fields.size() != header.size()) {
            throw std::runtime_error(samples_path + ":" + std::to_string(line_no) + ": expected " +
                                     std::to_string(header.size()) + " fields, got " +
                                     std::to_string(fields.size()));
        }

        SampleRow row;
        row.element_id = trim(fields[0]);
        row.values.reserve(fields.size() - 1);
        for (size_t c = 1; c < fields.size(); ++c) {
            row.values.push_back(parse_value(fields[c], samples_path, line_no));
        }
        rows.push_back(std::move(row));
    }
    local.input_elements = rows.size();

    // ------------------------------------------------------------------
    // Filters + per-cell-type means (rows are independent)
    // ------------------------------------------------------------------
    enum RowState : uint8_t { kKeep = 0, kLow = 1, kUnknown = 2, kZero = 3 };
    std::vector<uint8_t> state(rows.size(), kKeep);
    std::vector<std::vector<double>> means(rows.size());

    std::vector<size_t> indices(rows.size());
    std::iota(indices.begin(), indices.end(), 0);

    std::for_each(std::execution::par, indices.begin(), indices.end(),
        [&](size_t r) {
            const auto& values = rows[r].values;
            const double max_v = values.empty()
                ? 0.0 : *std::max_element(values.begin(), values.end());
            if (!(max_v > config.min_max_expression)) {
                state[r] = kLow;
                return;
            }
            if (!known_ids.empty() && known_ids.count(rows[r].element_id) == 0) {
                state[r] = kUnknown;
                return;
            }
            const double total = std::accumulate(values.begin(), values.end(), 0.0);
            if (!(total > 0.0)) {
                state[r] = kZero;
                return;
            }

            std::vector<double> sums(group_names.size(), 0.0);
            std::vector<size_t> counts(group_names.size(), 0);
            for (size_t c = 0; c < values.size(); ++c) {
                const int g = column_group[c];
                if (g < 0) continue;
                sums[g] += values[c];
                ++counts[g];
            }
            auto& out = means[r];
            out.assign(group_names.size(), 0.0);
            for (size_t g = 0; g < group_names.size(); ++g) {
                if (counts[g] > 0) out[g] = sums[g] / static_cast<double>(counts[g]);
            }
        });

    ExpressionMatrix matrix;
    for (size_t r = 0; r < rows.size(); ++r) {
        switch (state[r]) {
            case kLow: ++local.dropped_low_expression; continue;
            case kUnknown: ++local.dropped_unknown; continue;
            case kZero: ++local.dropped_zero_total; continue;
            default: break;
        }
        matrix.add_element(rows[r].element_id);
        for (size_t g = 0; g < group_names.size(); ++g) {
            matrix.set(rows[r].element_id, group_names[g], means[r][g]);
        }
        ++local.kept_elements;
    }

    if (local.unmapped_samples > 0) {
        std::cerr << "[Loader] " << local.unmapped_samples
                  << " sample column(s) without metadata in " << samples_path << std::endl;
    }
    if (config.verbose) {
        std::cout << "  [Loader] " << local.input_elements << " elements x "
                  << local.input_samples << " samples -> "
                  << local.kept_elements << " elements x "
                  << group_names.size() << " cell types" << std::endl;
        std::cout << "  [Loader] dropped: low=" << local.dropped_low_expression
                  << " unknown=" << local.dropped_unknown
                  << " zero=" << local.dropped_zero_total << std::endl;
    }

    if (stats) *stats = local;
    return matrix;
}

// ============================================================================
// Element catalogs
// ============================================================================

std::string derive_seed(const std::string& mature_seq) {
    if (mature_seq.size() < 8) return {};
    return normalize_rna(mature_seq.substr(1, 7));
}

ElementCatalog load_family_info(const std::string& path, int32_t species_id) {
    std::ifstream in = open_or_throw(path);
    const char delim = '\t';

    std::string line;
    if (!std::getline(in, line)) {
        throw std::runtime_error(path + ": empty file");
    }
    const auto header = split_fields(line, delim);
    const int species_col = require_column(header, "Species ID", path);
    const int id_col = require_column(header, "MiRBase ID", path);
    const int mature_col = require_column(header, "Mature sequence", path);
    const int seed_col = require_column(header, "Seed+m8", path);
    const int max_col = std::max({species_col, id_col, mature_col, seed_col});
    const std::string species = std::to_string(species_id);

    ElementCatalog catalog;
    while (std::getline(in, line)) {
        if (trim(line).empty()) continue;
        const auto fields = split_fields(line, delim);
        if (static_cast<int>(fields.size()) <= max_col) continue;
        if (trim(fields[species_col]) != species) continue;

        const std::string id = trim(fields[id_col]);
        if (id.empty() || catalog.mature_seqs.count(id)) continue;

        catalog.mature_seqs[id] = trim(fields[mature_col]);
        catalog.seeds[id] = trim(fields[seed_col]);
    }
    return catalog;
}

size_t apply_seed_map(const std::string& path, ElementCatalog& catalog) {
    std::ifstream in = open_or_throw(path);
    const char delim = delimiter_for(path);

    std::string line;
    if (!std::getline(in, line)) {
        throw std::runtime_error(path + ": empty file");
    }
    const auto header = split_fields(line, delim);
    const int id_col = require_column(header, "MiRBase_ID", path);
    const int seed_col = require_column(header, "seed", path);
    const int max_col = std::max(id_col, seed_col);

    std::set<std::string> touched;
    while (std::getline(in, line)) {
        if (trim(line).empty()) continue;
        const auto fields = split_fields(line, delim);
        if (static_cast<int>(fields.size()) <= max_col) continue;
        const std::string id = trim(fields[id_col]);
        if (id.empty()) continue;
        catalog.seeds[id] = trim(fields[seed_col]);
        touched.insert(id);
    }
    return touched.size();
}

std::set<std::string> load_seed_map_ids(const std::string& path) {
    std::ifstream in = open_or_throw(path);
    const char delim = delimiter_for(path);

    std::string line;
    if (!std::getline(in, line)) {
        throw std::runtime_error(path + ": empty file");
    }
    const auto header = split_fields(line, delim);
    const int id_col = require_column(header, "MiRBase_ID", path);

    std::set<std::string> ids;
    while (std::getline(in, line)) {
        const auto fields = split_fields(line, delim);
        if (static_cast<int>(fields.size()) <= id_col) continue;
        const std::string id = trim(fields[id_col]);
        if (!id.empty()) ids.insert(id);
    }
    return ids;
}

ElementCatalog load_mature_fasta(const std::string& path) {
    FastaReader reader(path);
    if (!reader.is_valid()) {
        throw std::runtime_error("Cannot read FASTA: " + path);
    }

    ElementCatalog catalog;
    for (auto& rec : reader.read_all()) {
        if (catalog.mature_seqs.count(rec.name)) {
            std::cerr << "[Loader] duplicate record " << rec.name
                      << " in " << path << ", keeping the first" << std::endl;
            continue;
        }
        catalog.seeds[rec.name] = derive_seed(rec.sequence);
        catalog.mature_seqs[rec.name] = normalize_rna(rec.sequence);
    }
    return catalog;
}

ElementCatalog load_catalog(const std::string& path, int32_t species_id) {
    const std::string ext = lower_extension(path);
    if (ext == "fa" || ext == "fasta" || ext == "fna") {
        return load_mature_fasta(path);
    }
    return load_family_info(path, species_id);
}

std::string load_context_sequence(const std::string& fasta_path,
                                  const std::string& record_name) {
    FastaReader reader(fasta_path);
    if (!reader.is_valid()) {
        throw std::runtime_error("Cannot read FASTA: " + fasta_path);
    }
    if (reader.num_sequences() == 0) {
        throw std::runtime_error("No records in " + fasta_path);
    }

    const std::string name = record_name.empty() ? reader.sequence_name(0) : record_name;
    return reader.fetch(name);
}

}  // namespace sponge
