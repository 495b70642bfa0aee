#include "correct/CorrectionCache.h"

namespace bcfix::correct {

CorrectionCache::CorrectionCache(std::size_t capacity) : m_capacity(capacity) {
    m_entries.reserve(capacity);
    m_order.reserve(capacity);
}

std::string CorrectionCache::make_key(std::string_view raw, std::string_view qstring) {
    // The separator keeps ("AC", "GT!") and ("ACG", "T!") apart.
    std::string key;
    key.reserve(raw.size() + qstring.size() + 1);
    key.append(raw);
    key.push_back('\t');
    key.append(qstring);
    return key;
}

const CorrectionDecision* CorrectionCache::find(std::string_view raw,
                                                std::string_view qstring) const {
    if (m_capacity == 0) {
        return nullptr;
    }
    auto it = m_entries.find(make_key(raw, qstring));
    if (it == m_entries.end()) {
        ++m_misses;
        return nullptr;
    }
    ++m_hits;
    return &it->second;
}

void CorrectionCache::insert(std::string_view raw,
                             std::string_view qstring,
                             const CorrectionDecision& decision) {
    if (m_capacity == 0) {
        return;
    }
    auto key = make_key(raw, qstring);
    if (m_entries.count(key) != 0) {
        return;
    }

    if (m_order.size() < m_capacity) {
        m_order.push_back(key);
    } else {
        m_entries.erase(m_order[m_next]);
        m_order[m_next] = key;
        m_next = (m_next + 1) % m_capacity;
    }
    m_entries.emplace(std::move(key), decision);
}

}  // namespace bcfix::correct
