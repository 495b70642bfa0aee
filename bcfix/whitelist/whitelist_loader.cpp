#include "whitelist/whitelist_loader.h"

#include "utils/errors.h"
#include "utils/string_utils.h"
#include "whitelist/WhitelistIndex.h"

#include <spdlog/spdlog.h>
#include <zlib.h>

#include <array>
#include <charconv>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <unordered_map>

namespace bcfix::whitelist {

namespace {

struct GzFileDestructor {
    void operator()(gzFile file) {
        if (file && gzclose(file) != Z_OK) {
            spdlog::warn("Problem closing gzFile.");
        }
    }
};
using GzFilePtr = std::unique_ptr<std::remove_pointer_t<gzFile>, GzFileDestructor>;

// Line reader over gzopen, which reads uncompressed files transparently.
class TextLineReader {
public:
    explicit TextLineReader(const std::filesystem::path& path) : m_path(path.string()) {
        if (!std::filesystem::is_regular_file(path)) {
            throw ConfigurationError("File doesn't exist at " + m_path);
        }
        m_file.reset(gzopen(m_path.c_str(), "rb"));
        if (!m_file) {
            throw ConfigurationError("Could not open file: " + m_path);
        }
    }

    bool get_line(std::string& line) {
        line.clear();
        while (gzgets(m_file.get(), m_buffer.data(), static_cast<int>(m_buffer.size()))) {
            line += m_buffer.data();
            if (!line.empty() && line.back() == '\n') {
                break;
            }
        }
        int error_code = Z_OK;
        gzerror(m_file.get(), &error_code);
        if (error_code != Z_OK && error_code != Z_STREAM_END) {
            throw ConfigurationError("Error reading " + m_path);
        }
        if (line.empty()) {
            return false;
        }
        ++m_line_number;
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }
        return true;
    }

    std::size_t line_number() const { return m_line_number; }
    const std::string& path() const { return m_path; }

private:
    std::string m_path;
    GzFilePtr m_file;
    std::array<char, 4096> m_buffer{};
    std::size_t m_line_number{0};
};

bool is_skipped_line(std::string_view line) { return line.empty() || line.front() == '#'; }

}  // namespace

std::vector<std::string> load_whitelist(const std::filesystem::path& path) {
    TextLineReader reader(path);
    std::vector<std::string> barcodes;
    std::string line;
    while (reader.get_line(line)) {
        const auto token = utils::first_token(line);
        if (is_skipped_line(token)) {
            continue;
        }
        barcodes.emplace_back(token);
    }
    spdlog::debug("Read {} barcodes from {}", barcodes.size(), reader.path());
    return barcodes;
}

std::vector<BarcodeCount> load_barcode_counts(const std::filesystem::path& path) {
    TextLineReader reader(path);
    std::vector<BarcodeCount> counts;
    std::unordered_map<std::string, std::size_t> positions;
    std::string line;
    while (reader.get_line(line)) {
        const auto trimmed = utils::trim_view(line);
        if (is_skipped_line(trimmed)) {
            continue;
        }
        const auto fields = utils::split_view(trimmed, '\t');
        uint64_t count = 0;
        const auto count_field = fields.size() == 2 ? utils::trim_view(fields[1]) : "";
        const auto [end, ec] =
                std::from_chars(count_field.data(), count_field.data() + count_field.size(), count);
        if (fields.size() != 2 || fields[0].empty() || count_field.empty() || ec != std::errc{} ||
            end != count_field.data() + count_field.size()) {
            throw ConfigurationError("Malformed counts line " +
                                     std::to_string(reader.line_number()) + " in " +
                                     reader.path() + ": '" + line + "'");
        }

        std::string barcode(fields[0]);
        auto [it, inserted] = positions.emplace(barcode, counts.size());
        if (inserted) {
            counts.emplace_back(std::move(barcode), count);
        } else {
            counts[it->second].second += count;
        }
    }
    spdlog::debug("Read counts for {} barcodes from {}", counts.size(), reader.path());
    return counts;
}

std::vector<uint64_t> match_counts_to_whitelist(const std::vector<BarcodeCount>& counts,
                                                const WhitelistIndex& index) {
    std::vector<uint64_t> matched(index.size(), 0);
    std::size_t num_unknown = 0;
    for (const auto& [barcode, count] : counts) {
        if (static_cast<int>(barcode.size()) != index.barcode_length()) {
            ++num_unknown;
            continue;
        }
        const auto barcode_index = index.find_exact(barcode);
        if (!barcode_index) {
            ++num_unknown;
            continue;
        }
        matched[*barcode_index] += count;
    }
    if (num_unknown > 0) {
        spdlog::warn("Ignored counts for {} barcodes not present in the whitelist.", num_unknown);
    }
    return matched;
}

void write_barcode_counts(const std::filesystem::path& path,
                          const WhitelistIndex& index,
                          const std::vector<uint64_t>& counts) {
    if (counts.size() != index.size()) {
        throw std::invalid_argument("Expected " + std::to_string(index.size()) +
                                    " counts, given " + std::to_string(counts.size()));
    }

    std::ofstream file;
    if (path != "-") {
        file.open(path);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open file for writing: " + path.string());
        }
    }
    std::ostream& out = path == "-" ? std::cout : file;
    for (uint32_t i = 0; i < counts.size(); ++i) {
        if (counts[i] > 0) {
            out << index.barcode(i) << '\t' << counts[i] << '\n';
        }
    }
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed writing counts to " + path.string());
    }
}

}  // namespace bcfix::whitelist
