#ifndef WORD_LADDER_PATH_FINDER_HPP
#define WORD_LADDER_PATH_FINDER_HPP

#include <map>
#include <optional>
#include <string>

#include "dictionary.hpp"
#include "neighbor_oracle.hpp"
#include "word.hpp"


namespace word_ladder {


/// @brief Breadth-first search for the shortest word ladder
/// @details Edges are computed on demand through one NeighborIndex per word length,
/// built once at construction. Start and end words are always part of the search
/// space, whether or not the dictionary contains them, but are never added to the
/// indexes. solve() keeps no state between calls.
class PathFinder {
public:
    explicit PathFinder(Dictionary dictionary);

    ~PathFinder() = default;

    /// @brief Shortest ladder from start to end
    /// @param start Start word (any case)
    /// @param end End word (any case)
    /// @return Ladder including both endpoints, or std::nullopt if end is unreachable
    /// @throws std::invalid_argument if the words are malformed or their length does not fit the dictionary
    std::optional<Ladder> solve(const std::string& start, const std::string& end) const;

    const Dictionary& dictionary() const { return dictionary_; }

private:
    Dictionary dictionary_;

    std::map<std::size_t, NeighborIndex> indexes_;
};


/// @brief Shortest ladder from start to end through dictionary
/// @see PathFinder::solve
std::optional<Ladder> find_shortest_path(const std::string& start, const std::string& end, const Dictionary& dictionary);


}  // namespace word_ladder


#endif  // WORD_LADDER_PATH_FINDER_HPP
