/*
 * Copyright 2026 Switchback Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// String Utilities - Suggestions, Masking and Joins

#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace switchback::core {

/// Levenshtein edit distance (two-row dynamic programming)
[[nodiscard]] inline size_t levenshtein_distance(std::string_view s1, std::string_view s2) {
    if (s1.empty())
        return s2.size();
    if (s2.empty())
        return s1.size();

    std::vector<size_t> prev(s2.size() + 1);
    std::vector<size_t> curr(s2.size() + 1);
    for (size_t j = 0; j <= s2.size(); ++j) {
        prev[j] = j;
    }

    for (size_t i = 1; i <= s1.size(); ++i) {
        curr[0] = i;
        for (size_t j = 1; j <= s2.size(); ++j) {
            size_t substitution = prev[j - 1] + (s1[i - 1] == s2[j - 1] ? 0 : 1);
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, substitution});
        }
        std::swap(prev, curr);
    }
    return prev[s2.size()];
}

/// Candidates within max_distance edits of target, closest first (exact matches excluded)
[[nodiscard]] inline std::vector<std::string> find_similar_strings(
    std::string_view target, const std::vector<std::string>& candidates, size_t max_distance = 3) {
    std::vector<std::pair<std::string, size_t>> matches;
    for (const auto& candidate : candidates) {
        size_t distance = levenshtein_distance(target, candidate);
        if (distance > 0 && distance <= max_distance) {
            matches.emplace_back(candidate, distance);
        }
    }

    std::stable_sort(matches.begin(), matches.end(),
                     [](const auto& a, const auto& b) { return a.second < b.second; });

    std::vector<std::string> result;
    result.reserve(matches.size());
    for (auto& [name, _] : matches) {
        result.push_back(std::move(name));
    }
    return result;
}

/// Join strings with a delimiter
[[nodiscard]] inline std::string join(const std::vector<std::string>& strings,
                                      std::string_view delimiter) {
    std::string result;
    for (size_t i = 0; i < strings.size(); ++i) {
        if (i > 0) {
            result += delimiter;
        }
        result += strings[i];
    }
    return result;
}

/// Credential preview for request logs: "abcd...wxyz" when longer than 12 chars
[[nodiscard]] inline std::string preview_token(std::string_view token) {
    if (token.size() <= 12) {
        return std::string{token};
    }
    std::string out{token.substr(0, 4)};
    out += "...";
    out += token.substr(token.size() - 4);
    return out;
}

/// Credential mask for management output: "****" up to 8 chars, else "abcd...wxyz"
[[nodiscard]] inline std::string mask_token(std::string_view token) {
    if (token.size() <= 8) {
        return "****";
    }
    std::string out{token.substr(0, 4)};
    out += "...";
    out += token.substr(token.size() - 4);
    return out;
}

/// Cut a body for logging, appending "..." when shortened
[[nodiscard]] inline std::string truncate_for_log(std::string_view text, size_t limit = 500) {
    if (text.size() <= limit) {
        return std::string{text};
    }
    std::string out{text.substr(0, limit)};
    out += "...";
    return out;
}

/// ASCII case-insensitive equality
[[nodiscard]] constexpr bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        char ca = (a[i] >= 'A' && a[i] <= 'Z') ? static_cast<char>(a[i] + 32) : a[i];
        char cb = (b[i] >= 'A' && b[i] <= 'Z') ? static_cast<char>(b[i] + 32) : b[i];
        if (ca != cb) {
            return false;
        }
    }
    return true;
}

}  // namespace switchback::core
