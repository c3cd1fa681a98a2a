#include <path_finder.hpp>

#include <algorithm>
#include <initializer_list>
#include <queue>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>


namespace word_ladder {


namespace {


struct Endpoints {
    Word start;
    Word end;
};


void check_word(const Word& word, const char* role) {
    if (!is_word(word)) {
        throw std::invalid_argument(std::string(role) + " word '" + word + "' must be a non-empty sequence of letters");
    }
}


Endpoints check_endpoints(const std::string& start_text, const std::string& end_text) {
    Endpoints endpoints{normalize(start_text), normalize(end_text)};

    check_word(endpoints.start, "Start");
    check_word(endpoints.end, "End");
    if (endpoints.start.size() != endpoints.end.size()) {
        throw std::invalid_argument("Start word '" + endpoints.start + "' and end word '" + endpoints.end
                                    + "' differ in length (" + std::to_string(endpoints.start.size()) + " != "
                                    + std::to_string(endpoints.end.size()) + ")");
    }
    return endpoints;
}


/// @param index Dictionary words of the endpoint length, nullptr if there are none
void check_length(const Endpoints& endpoints, const Dictionary& dictionary, const NeighborIndex* index) {
    const auto length = endpoints.start.size();
    const auto fixed = dictionary.word_length();
    if (fixed && *fixed != length) {
        throw std::invalid_argument("Word length " + std::to_string(length)
                                    + " does not match dictionary word length " + std::to_string(*fixed));
    }
    if (!dictionary.empty() && (!index || index->size() == 0)) {
        throw std::invalid_argument("Dictionary has no words of length " + std::to_string(length));
    }
}


// Neighbors of word in the index, plus whichever endpoint is one letter away
std::set<Word> expand(const Word& word, const Endpoints& endpoints, const NeighborIndex* index) {
    std::set<Word> result;
    if (index) result = index->neighbors(word);

    for (const Word* endpoint : {&endpoints.start, &endpoints.end}) {
        if (hamming_distance(word, *endpoint) == 1) result.insert(*endpoint);
    }
    return result;
}


std::optional<Ladder> search(const Endpoints& endpoints, const NeighborIndex* index) {
    const auto& start = endpoints.start;
    const auto& end = endpoints.end;

    // Visited words mapped to the word they were discovered from
    std::unordered_map<Word, Word> parent;
    std::queue<Word> frontier;

    parent.emplace(start, Word{});
    frontier.push(start);

    while (!frontier.empty()) {
        const auto current = frontier.front();
        frontier.pop();

        if (current == end) {
            Ladder ladder{current};
            for (auto it = parent.find(current); !it->second.empty(); it = parent.find(it->second)) {
                ladder.push_back(it->second);
            }
            std::reverse(ladder.begin(), ladder.end());
            return ladder;
        }

        for (const auto& next : expand(current, endpoints, index)) {
            if (!parent.emplace(next, current).second) continue;
            frontier.push(next);
        }
    }

    // End unreachable
    return std::nullopt;
}


}  // namespace


PathFinder::PathFinder(Dictionary dictionary) : dictionary_(std::move(dictionary)) {
    for (const auto length : dictionary_.lengths()) {
        NeighborIndex index(dictionary_, length);
        indexes_.emplace(index.word_length(), std::move(index));
    }
}


std::optional<Ladder> PathFinder::solve(const std::string& start, const std::string& end) const {
    const auto endpoints = check_endpoints(start, end);
    if (endpoints.start == endpoints.end) {
        return Ladder{endpoints.start};
    }

    const auto it = indexes_.find(endpoints.start.size());
    const NeighborIndex* index = it == indexes_.end() ? nullptr : &it->second;

    check_length(endpoints, dictionary_, index);
    return search(endpoints, index);
}


std::optional<Ladder> find_shortest_path(const std::string& start, const std::string& end, const Dictionary& dictionary) {
    const auto endpoints = check_endpoints(start, end);
    if (endpoints.start == endpoints.end) {
        return Ladder{endpoints.start};
    }

    const NeighborIndex index(dictionary, endpoints.start.size());

    check_length(endpoints, dictionary, &index);
    return search(endpoints, &index);
}


}  // namespace word_ladder
