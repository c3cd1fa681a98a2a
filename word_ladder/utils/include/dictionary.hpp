#ifndef WORD_LADDER_DICTIONARY_HPP
#define WORD_LADDER_DICTIONARY_HPP

#include <initializer_list>
#include <optional>
#include <set>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "word.hpp"


namespace word_ladder {


/// @brief Set of normalized words a ladder may step through
/// @details Entries are lowercased on insertion. Empty or non-alphabetic entries are
/// ignored, and so are entries of another length when a fixed word length is set.
class Dictionary {
public:
    using const_iterator = std::set<Word>::const_iterator;

    Dictionary() = default;

    /// @brief Create a dictionary that only accepts words of the given length
    /// @param word_length Fixed word length
    explicit Dictionary(std::size_t word_length) : word_length_(word_length) {
        if (word_length == 0) {
            throw std::invalid_argument("Dictionary word length must be positive");
        }
    }

    Dictionary(std::initializer_list<std::string_view> words) {
        for (const auto word : words) insert(word);
    }

    template <typename InputIt>
    Dictionary(InputIt first, InputIt last) {
        for (; first != last; ++first) insert(*first);
    }

    /// @brief Insert a word
    /// @return true if the word was accepted and was not already present
    bool insert(std::string_view text) {
        if (!is_word(text)) return false;
        if (word_length_ && text.size() != *word_length_) return false;
        return words_.insert(normalize(text)).second;
    }

    bool contains(std::string_view text) const {
        return words_.count(normalize(text)) > 0;
    }

    std::size_t size() const { return words_.size(); }

    bool empty() const { return words_.empty(); }

    /// @brief Fixed word length, if one was set at construction
    std::optional<std::size_t> word_length() const { return word_length_; }

    /// @brief Distinct word lengths present, ascending
    std::set<std::size_t> lengths() const {
        std::set<std::size_t> out;
        for (const auto& w : words_) out.insert(w.size());
        return out;
    }

    /// @brief Words of length n in lexicographic order
    std::vector<Word> words_of_length(std::size_t n) const {
        std::vector<Word> out;
        for (const auto& w : words_) {
            if (w.size() == n) out.push_back(w);
        }
        return out;
    }

    const_iterator begin() const { return words_.begin(); }

    const_iterator end() const { return words_.end(); }

private:
    std::optional<std::size_t> word_length_{};

    std::set<Word> words_{};
};


}  // namespace word_ladder


#endif  // WORD_LADDER_DICTIONARY_HPP
