#pragma once

#include "utils/ReadRecord.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

struct BGZF;

namespace bcfix::hts_io {

struct BgzfDestructor {
    void operator()(BGZF* fp);
};
using BgzfPtr = std::unique_ptr<BGZF, BgzfDestructor>;

// Writes FASTQ records through htslib's BGZF layer. Output is block-gzip compressed when the path
// ends in ".gz", plain otherwise. "-" writes uncompressed to stdout.
class FastqWriter {
public:
    FastqWriter(const std::filesystem::path& path, int threads);
    ~FastqWriter();
    FastqWriter(const FastqWriter&) = delete;
    FastqWriter& operator=(const FastqWriter&) = delete;

    // Records without qualities are written with '!' qualities. Throws std::runtime_error if the
    // write fails.
    void write(const utils::ReadRecord& record);

    // Flushes and closes the output. Must be called before destruction to detect write errors.
    void finalise();

    uint64_t num_records() const { return m_num_records; }

private:
    std::string m_path;
    BgzfPtr m_file;
    std::string m_buffer;
    uint64_t m_num_records{0};
    bool m_finalised{false};
};

// Formats a record as four FASTQ lines. The comment, when present, follows the id after a space.
std::string format_fastq_record(const utils::ReadRecord& record);

}  // namespace bcfix::hts_io
