#pragma once

#include "correct/CorrectionDecision.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bcfix::correct {

// Bounded memo of correction decisions keyed on (raw barcode, quality string). When full the
// oldest entry is evicted. Not thread safe: each worker owns its own cache.
class CorrectionCache {
public:
    // A capacity of 0 disables caching: find() never hits and insert() does nothing.
    explicit CorrectionCache(std::size_t capacity);

    [[nodiscard]] const CorrectionDecision* find(std::string_view raw,
                                                 std::string_view qstring) const;
    void insert(std::string_view raw, std::string_view qstring, const CorrectionDecision& decision);

    [[nodiscard]] std::size_t size() const { return m_entries.size(); }
    [[nodiscard]] std::size_t capacity() const { return m_capacity; }

    uint64_t hits() const { return m_hits; }
    uint64_t misses() const { return m_misses; }

private:
    static std::string make_key(std::string_view raw, std::string_view qstring);

    const std::size_t m_capacity;
    std::unordered_map<std::string, CorrectionDecision> m_entries;
    // Insertion order of the keys in m_entries. m_next is the slot overwritten by the next insert.
    std::vector<std::string> m_order;
    std::size_t m_next{0};
    mutable uint64_t m_hits{0};
    mutable uint64_t m_misses{0};
};

}  // namespace bcfix::correct
