#include "core/text.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <unordered_map>

namespace nlquery::text {

namespace {

enum class CharKind : uint8_t { SEPARATOR, LOWER, UPPER, DIGIT };

// 256-entry lookup, same shape as a fingerprinting char table
struct CharTable {
    std::array<CharKind, 256> kind{};

    constexpr CharTable() {
        for (int c = 0; c < 256; ++c) {
            if (c >= 'a' && c <= 'z') kind[c] = CharKind::LOWER;
            else if (c >= 'A' && c <= 'Z') kind[c] = CharKind::UPPER;
            else if (c >= '0' && c <= '9') kind[c] = CharKind::DIGIT;
            else if (c >= 0x80) kind[c] = CharKind::LOWER;  // UTF-8 bytes stay inside words
            else kind[c] = CharKind::SEPARATOR;
        }
    }

    [[nodiscard]] constexpr CharKind operator[](char c) const {
        return kind[static_cast<unsigned char>(c)];
    }
};

constexpr CharTable kChars{};

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

std::vector<std::string> split_identifier(std::string_view name) {
    std::vector<std::string> words;
    std::string current;

    const auto flush = [&]() {
        if (!current.empty()) {
            words.emplace_back(std::move(current));
            current.clear();
        }
    };

    for (size_t i = 0; i < name.size(); ++i) {
        const char c = name[i];
        const CharKind k = kChars[c];
        if (k == CharKind::SEPARATOR) {
            flush();
            continue;
        }

        if (!current.empty()) {
            const CharKind prev = kChars[name[i - 1]];
            const bool digit_change = (k == CharKind::DIGIT) != (prev == CharKind::DIGIT);
            const bool camel_hump = (k == CharKind::UPPER && prev == CharKind::LOWER);
            // "HRRecords": break before the last upper of an upper run followed by lower
            const bool acronym_end = (k == CharKind::UPPER && prev == CharKind::UPPER &&
                                      i + 1 < name.size() && kChars[name[i + 1]] == CharKind::LOWER);
            if (digit_change || camel_hump || acronym_end) {
                flush();
            }
        }
        current += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    flush();
    return words;
}

std::string singularize(std::string_view word) {
    static const std::unordered_map<std::string_view, std::string_view> irregular = {
        {"people", "person"},
        {"men", "man"},
        {"women", "woman"},
        {"children", "child"},
        {"staff", "staff"},
        {"data", "data"},
        {"criteria", "criterion"},
        {"indices", "index"},
    };

    if (const auto it = irregular.find(word); it != irregular.end()) {
        return std::string(it->second);
    }
    if (word.size() < 4) {
        return std::string(word);
    }
    if (ends_with(word, "ies")) {
        return std::string(word.substr(0, word.size() - 3)) + "y";
    }
    if (ends_with(word, "sses") || ends_with(word, "xes") ||
        ends_with(word, "ches") || ends_with(word, "shes")) {
        return std::string(word.substr(0, word.size() - 2));
    }
    if (ends_with(word, "ss") || ends_with(word, "us") || ends_with(word, "is")) {
        return std::string(word);
    }
    if (word.back() == 's') {
        return std::string(word.substr(0, word.size() - 1));
    }
    return std::string(word);
}

std::string normalize_identifier(std::string_view name) {
    std::string result;
    for (const auto& w : split_identifier(name)) {
        if (!result.empty()) result += ' ';
        result += singularize(w);
    }
    return result;
}

size_t levenshtein_distance(std::string_view a, std::string_view b) {
    if (a.size() < b.size()) std::swap(a, b);
    if (b.empty()) return a.size();

    // Two-row DP over the shorter string
    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> curr(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        curr[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            const size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

double edit_similarity(std::string_view a, std::string_view b) {
    if (a.empty() || b.empty()) return 0.0;
    const size_t longest = std::max(a.size(), b.size());
    return 1.0 - static_cast<double>(levenshtein_distance(a, b)) / static_cast<double>(longest);
}

double token_overlap(std::string_view a, std::string_view b) {
    const auto words = [](std::string_view s) {
        std::vector<std::string_view> out;
        size_t start = 0;
        while (start < s.size()) {
            const size_t end = std::min(s.find(' ', start), s.size());
            if (end > start) out.push_back(s.substr(start, end - start));
            start = end + 1;
        }
        return out;
    };

    auto wa = words(a);
    auto wb = words(b);
    if (wa.empty() || wb.empty()) return 0.0;

    std::sort(wa.begin(), wa.end());
    wa.erase(std::unique(wa.begin(), wa.end()), wa.end());
    std::sort(wb.begin(), wb.end());
    wb.erase(std::unique(wb.begin(), wb.end()), wb.end());

    std::vector<std::string_view> shared;
    std::set_intersection(wa.begin(), wa.end(), wb.begin(), wb.end(), std::back_inserter(shared));
    return static_cast<double>(shared.size()) / static_cast<double>(std::max(wa.size(), wb.size()));
}

double match_score(std::string_view a, std::string_view b) {
    return std::max(edit_similarity(a, b), token_overlap(a, b));
}

} // namespace nlquery::text
