#include "hts_io/FastxSequentialReader.h"

#include <unistd.h>
#include <zlib.h>

#include <stdexcept>
#include <string>

#include <htslib/kseq.h>

KSEQ_INIT(gzFile, gzread)

namespace bcfix::hts_io {

struct FastxSequentialReader::Data {
    gzFile fp{nullptr};
    kseq_t* seq{nullptr};
};

FastxSequentialReader::FastxSequentialReader(const std::filesystem::path& fastx_path)
        : data_{std::make_unique<FastxSequentialReader::Data>()}, path_{fastx_path.string()} {
    if (path_ == "-") {
        data_->fp = gzdopen(STDIN_FILENO, "r");
    } else {
        if (!std::filesystem::is_regular_file(fastx_path)) {
            throw std::runtime_error{"Input file doesn't exist: " + path_};
        }
        data_->fp = gzopen(path_.c_str(), "r");
    }
    if (!data_->fp) {
        throw std::runtime_error{"Could not open file: " + path_};
    }
    data_->seq = kseq_init(data_->fp);
}

FastxSequentialReader::~FastxSequentialReader() {
    if (data_->seq) {
        kseq_destroy(data_->seq);
    }
    if (data_->fp) {
        gzclose(data_->fp);
    }
}

bool FastxSequentialReader::get_next(utils::ReadRecord& record) {
    const int result = kseq_read(data_->seq);
    if (result == -1) {
        return false;
    }
    if (result < -1) {
        // -2: truncated quality string, -3: error reading the stream.
        throw std::runtime_error{"Malformed record " + std::to_string(num_records_ + 1) + " in " +
                                 path_ + " (kseq error " + std::to_string(result) + ")"};
    }

    ++num_records_;
    const kseq_t* seq = data_->seq;
    record.id.assign(seq->name.s, seq->name.l);
    record.comment.assign(seq->comment.s ? seq->comment.s : "", seq->comment.l);
    record.sequence.assign(seq->seq.s, seq->seq.l);
    record.qstring.assign(seq->qual.s ? seq->qual.s : "", seq->qual.l);
    return true;
}

}  // namespace bcfix::hts_io
