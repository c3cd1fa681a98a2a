#ifndef WORD_LADDER_WORD_IO_HPP
#define WORD_LADDER_WORD_IO_HPP

#include <filesystem>
#include <iosfwd>
#include <optional>

#include "dictionary.hpp"
#include "word.hpp"


namespace word_ladder {


//! Line written in place of a ladder when the search fails
inline constexpr const char* kNoPathMessage = "no path found";


struct LoadStats {
    std::size_t lines{0};
    std::size_t accepted{0};
    std::size_t skipped{0};
};


/// @brief Read a newline-delimited word list
/// @param in Input stream, one word per line
/// @param word_length Keep only words of this length (0 keeps every length)
/// @param stats Optional line counters
/// @return Normalized dictionary
Dictionary load_dictionary(std::istream& in, std::size_t word_length = 0, LoadStats* stats = nullptr);

/// @throws std::runtime_error if the file cannot be opened or read
Dictionary load_dictionary(const std::filesystem::path& path, std::size_t word_length = 0, LoadStats* stats = nullptr);


/// @brief Write a ladder one word per line, or kNoPathMessage if there is none
void write_ladder(std::ostream& out, const std::optional<Ladder>& ladder);

/// @throws std::runtime_error if the file cannot be opened or written
void save_ladder(const std::filesystem::path& path, const std::optional<Ladder>& ladder);


}  // namespace word_ladder


#endif  // WORD_LADDER_WORD_IO_HPP
