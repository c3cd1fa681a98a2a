#ifndef WORD_LADDER_NEIGHBOR_ORACLE_HPP
#define WORD_LADDER_NEIGHBOR_ORACLE_HPP

#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "dictionary.hpp"
#include "word.hpp"


namespace word_ladder {


/// @brief Dictionary words differing from word in exactly one position
/// @param word Word to expand (normalized before comparison)
/// @param dictionary Candidate words
/// @return Neighbors in lexicographic order, word itself excluded
std::set<Word> neighbors(const Word& word, const Dictionary& dictionary);


/// @brief Wildcard pattern index over words of a single length
/// @details Each word is bucketed once per position under the word with that position
/// blanked. Two words share a bucket for position i iff they agree everywhere except i.
class NeighborIndex {
public:
    explicit NeighborIndex(std::size_t word_length);

    /// @brief Index the dictionary words of the given length
    NeighborIndex(const Dictionary& dictionary, std::size_t word_length);

    /// @brief Add a word to the index
    /// @return false if the word has another length or was already indexed
    bool add(const Word& word);

    bool contains(const Word& word) const;

    /// @brief Same result as the direct scan over the indexed words
    std::set<Word> neighbors(const Word& word) const;

    std::size_t word_length() const { return word_length_; }

    std::size_t size() const { return size_; }

private:
    static std::string pattern(const Word& word, std::size_t position);

    std::size_t word_length_{};

    std::size_t size_{};

    // buckets_[i] maps the pattern blanked at position i to its words
    std::vector<std::unordered_map<std::string, std::vector<Word>>> buckets_;
};


}  // namespace word_ladder


#endif  // WORD_LADDER_NEIGHBOR_ORACLE_HPP
