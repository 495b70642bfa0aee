#include "hts_io/FastqWriter.h"

#include "utils/string_utils.h"

#include <htslib/bgzf.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace bcfix::hts_io {

void BgzfDestructor::operator()(BGZF* fp) {
    if (fp && bgzf_close(fp) != 0) {
        spdlog::warn("Problem closing BGZF output.");
    }
}

std::string format_fastq_record(const utils::ReadRecord& record) {
    std::string out;
    out.reserve(record.id.size() + record.comment.size() + 2 * record.sequence.size() + 8);
    out.append("@").append(record.id);
    if (!record.comment.empty()) {
        out.append(" ").append(record.comment);
    }
    out.append("\n").append(record.sequence).append("\n+\n");
    if (record.qstring.empty()) {
        out.append(record.sequence.size(), '!');
    } else {
        out.append(record.qstring);
    }
    out.append("\n");
    return out;
}

FastqWriter::FastqWriter(const std::filesystem::path& path, int threads) : m_path(path.string()) {
    const bool compressed = m_path != "-" && utils::ends_with(m_path, ".gz");
    m_file.reset(bgzf_open(m_path.c_str(), compressed ? "w" : "wu"));
    if (!m_file) {
        throw std::runtime_error("Could not open file for writing: " + m_path);
    }
    if (compressed && threads > 1) {
        if (bgzf_mt(m_file.get(), threads, 128) < 0) {
            throw std::runtime_error("Could not enable multi threading for FASTQ compression.");
        }
    }
}

FastqWriter::~FastqWriter() {
    if (!m_finalised) {
        spdlog::error("finalise() not called on a FastqWriter.");
    }
}

void FastqWriter::write(const utils::ReadRecord& record) {
    if (!record.qstring.empty() && record.qstring.size() != record.sequence.size()) {
        throw std::runtime_error("Record " + record.id +
                                 " has a quality string of a different length to its sequence.");
    }
    m_buffer = format_fastq_record(record);
    if (bgzf_write(m_file.get(), m_buffer.data(), m_buffer.size()) < 0) {
        throw std::runtime_error("Error writing to " + m_path);
    }
    ++m_num_records;
}

void FastqWriter::finalise() {
    if (m_finalised) {
        return;
    }
    m_finalised = true;
    if (bgzf_close(m_file.release()) != 0) {
        throw std::runtime_error("Error closing " + m_path);
    }
    spdlog::debug("Wrote {} records to {}", m_num_records, m_path);
}

}  // namespace bcfix::hts_io
