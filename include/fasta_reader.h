#ifndef SPONGE_FASTA_READER_H
#define SPONGE_FASTA_READER_H

#include <cstdint>
#include <string>
#include <vector>

#include <htslib/faidx.h>

namespace sponge {

struct FastaRecord {
    std::string name;
    std::string sequence;
};

/**
 * FastaReader: indexed FASTA access through htslib faidx
 * Builds the .fai index next to the file when it does not exist yet.
 */
class FastaReader {
public:
    explicit FastaReader(const std::string& fasta_path);
    ~FastaReader();

    // Disable copy, enable move
    FastaReader(const FastaReader&) = delete;
    FastaReader& operator=(const FastaReader&) = delete;
    FastaReader(FastaReader&& other) noexcept;
    FastaReader& operator=(FastaReader&& other) noexcept;

    bool is_valid() const { return fai_ != nullptr; }
    const std::string& path() const { return fasta_path_; }

    int32_t num_sequences() const;

    /**
     * Record name by index (first word of the header line)
     * @return empty string if out of range
     */
    std::string sequence_name(int32_t index) const;

    // -1 if the record does not exist
    int64_t sequence_length(const std::string& name) const;

    bool has_sequence(const std::string& name) const;

    /**
     * Fetch a full record. Throws std::runtime_error if the reader is not
     * valid or the record cannot be fetched.
     */
    std::string fetch(const std::string& name) const;

    // Every record in file order
    std::vector<FastaRecord> read_all() const;

private:
    std::string fasta_path_;
    faidx_t* fai_ = nullptr;
};

}  // namespace sponge

#endif  // SPONGE_FASTA_READER_H
