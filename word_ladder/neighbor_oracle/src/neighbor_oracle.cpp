#include <neighbor_oracle.hpp>

#include <algorithm>
#include <stdexcept>


namespace word_ladder {


std::set<Word> neighbors(const Word& word, const Dictionary& dictionary) {
    const auto key = normalize(word);

    std::set<Word> result;
    for (const auto& candidate : dictionary) {
        if (candidate.size() != key.size()) continue;
        if (hamming_distance(candidate, key) == 1) {
            result.insert(candidate);
        }
    }
    return result;
}


NeighborIndex::NeighborIndex(std::size_t word_length) : word_length_(word_length), buckets_(word_length) {
    if (word_length == 0) {
        throw std::invalid_argument("Cannot index words of length 0");
    }
}


NeighborIndex::NeighborIndex(const Dictionary& dictionary, std::size_t word_length) : NeighborIndex(word_length) {
    for (const auto& word : dictionary.words_of_length(word_length)) {
        add(word);
    }
}


std::string NeighborIndex::pattern(const Word& word, std::size_t position) {
    std::string key = word;
    key[position] = '*';
    return key;
}


bool NeighborIndex::add(const Word& word) {
    if (word.size() != word_length_) return false;

    const auto key = normalize(word);
    if (contains(key)) return false;

    for (std::size_t i = 0; i < word_length_; ++i) {
        buckets_[i][pattern(key, i)].push_back(key);
    }
    ++size_;
    return true;
}


bool NeighborIndex::contains(const Word& word) const {
    if (word.size() != word_length_) return false;

    const auto key = normalize(word);
    const auto it = buckets_[0].find(pattern(key, 0));
    if (it == buckets_[0].end()) return false;
    return std::find(it->second.begin(), it->second.end(), key) != it->second.end();
}


std::set<Word> NeighborIndex::neighbors(const Word& word) const {
    std::set<Word> result;
    if (word.size() != word_length_) return result;

    const auto key = normalize(word);
    for (std::size_t i = 0; i < word_length_; ++i) {
        const auto it = buckets_[i].find(pattern(key, i));
        if (it == buckets_[i].end()) continue;

        for (const auto& candidate : it->second) {
            if (candidate != key) result.insert(candidate);
        }
    }
    return result;
}


}  // namespace word_ladder
