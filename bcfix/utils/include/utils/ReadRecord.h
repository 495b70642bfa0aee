#pragma once

#include <string>

namespace bcfix::utils {

// A FASTA/FASTQ record. qstring is empty for records without qualities.
struct ReadRecord {
    std::string id;
    std::string comment;
    std::string sequence;
    std::string qstring;
};

inline bool operator==(const ReadRecord& lhs, const ReadRecord& rhs) {
    return lhs.id == rhs.id && lhs.comment == rhs.comment && lhs.sequence == rhs.sequence &&
           lhs.qstring == rhs.qstring;
}

}  // namespace bcfix::utils
