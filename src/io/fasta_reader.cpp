#include "fasta_reader.h"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace sponge {

FastaReader::FastaReader(const std::string& fasta_path) : fasta_path_(fasta_path) {
    fai_ = fai_load(fasta_path.c_str());
    if (!fai_) {
        std::cerr << "[Error] Failed to load FASTA index: " << fasta_path << std::endl;
    }
}

FastaReader::~FastaReader() {
    if (fai_) fai_destroy(fai_);
}

FastaReader::FastaReader(FastaReader&& other) noexcept
    : fasta_path_(std::move(other.fasta_path_)),
      fai_(other.fai_) {
    other.fai_ = nullptr;
}

FastaReader& FastaReader::operator=(FastaReader&& other) noexcept {
    if (this != &other) {
        if (fai_) fai_destroy(fai_);
        fasta_path_ = std::move(other.fasta_path_);
        fai_ = other.fai_;
        other.fai_ = nullptr;
    }
    return *this;
}

int32_t FastaReader::num_sequences() const {
    return fai_ ? faidx_nseq(fai_) : 0;
}

std::string FastaReader::sequence_name(int32_t index) const {
    if (!fai_ || index < 0 || index >= faidx_nseq(fai_)) return {};
    const char* name = faidx_iseq(fai_, index);
    return name ? std::string(name) : std::string();
}

int64_t FastaReader::sequence_length(const std::string& name) const {
    if (!fai_) return -1;
    return faidx_seq_len(fai_, name.c_str());
}

bool FastaReader::has_sequence(const std::string& name) const {
    return fai_ && faidx_has_seq(fai_, name.c_str()) != 0;
}

std::string FastaReader::fetch(const std::string& name) const {
    if (!fai_) {
        throw std::runtime_error("FASTA reader is not valid: " + fasta_path_);
    }

    const int64_t len = sequence_length(name);
    if (len < 0) {
        throw std::runtime_error("Record '" + name + "' not found in " + fasta_path_);
    }
    if (len == 0) return {};

    hts_pos_t fetched = 0;
    // faidx end coordinate is inclusive
    char* raw = faidx_fetch_seq64(fai_, name.c_str(), 0, len - 1, &fetched);
    if (!raw || fetched < 0) {
        if (raw) std::free(raw);
        throw std::runtime_error("Failed to fetch '" + name + "' from " + fasta_path_);
    }

    std::string seq(raw, static_cast<size_t>(fetched));
    std::free(raw);
    return seq;
}

std::vector<FastaRecord> FastaReader::read_all() const {
    std::vector<FastaRecord> records;
    const int32_t n = num_sequences();
    records.reserve(static_cast<size_t>(n));
    for (int32_t i = 0; i < n; ++i) {
        FastaRecord rec;
        rec.name = sequence_name(i);
        rec.sequence = fetch(rec.name);
        records.push_back(std::move(rec));
    }
    return records;
}

}  // namespace sponge
