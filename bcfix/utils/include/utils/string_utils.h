#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace bcfix::utils {

[[nodiscard]] inline std::vector<std::string_view> split_view(const std::string_view input,
                                                              const char delimiter) {
    if (std::empty(input)) {
        return {};
    }
    size_t start = 0;
    size_t pos = 0;
    std::vector<std::string_view> result;
    while ((pos = input.find(delimiter, start)) != std::string_view::npos) {
        result.emplace_back(std::string_view(std::data(input) + start, pos - start));
        start = pos + 1;
    }
    result.emplace_back(std::string_view(std::data(input) + start, std::size(input) - start));
    return result;
}

template <typename StringLike>
[[nodiscard]] inline std::string join(const std::vector<StringLike>& inputs,
                                      std::string_view separator) {
    std::string result;
    for (const auto& item : inputs) {
        if (!result.empty()) {
            result += separator;
        }
        result += item;
    }
    return result;
}

[[nodiscard]] inline bool ends_with(std::string_view str, std::string_view suffix) {
    if (str.length() < suffix.length()) {
        return false;
    }
    return str.substr(str.length() - suffix.length()) == suffix;
}

[[nodiscard]] inline std::string_view trim_view(std::string_view s) {
    const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

// First token of a line, where tokens are separated by whitespace or commas.
[[nodiscard]] inline std::string_view first_token(std::string_view line) {
    line = trim_view(line);
    const auto end = line.find_first_of(" \t,");
    return end == std::string_view::npos ? line : line.substr(0, end);
}

}  // namespace bcfix::utils
