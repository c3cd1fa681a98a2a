#ifndef WORD_LADDER_WORD_HPP
#define WORD_LADDER_WORD_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>


namespace word_ladder {


using Word = std::string;


//! Ordered sequence of words, start first, end last
using Ladder = std::vector<Word>;


/// @brief Lowercase copy of a word
/// @param text Raw word
/// @return Normalized word
inline Word normalize(std::string_view text) {
    Word word(text);
    for (auto& c : word) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return word;
}


/// @brief Check that text is a non-empty sequence of letters
inline bool is_word(std::string_view text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isalpha(c); });
}


/// @brief Number of positions at which two words differ
/// @details Extra characters of the longer word count as differing positions
inline std::size_t hamming_distance(std::string_view a, std::string_view b) {
    const auto common = std::min(a.size(), b.size());
    std::size_t n = std::max(a.size(), b.size()) - common;
    for (std::size_t i = 0; i < common; ++i) {
        if (a[i] != b[i]) ++n;
    }
    return n;
}


}  // namespace word_ladder


#endif  // WORD_LADDER_WORD_HPP
