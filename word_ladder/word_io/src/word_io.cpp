#include <word_io.hpp>

#include <fstream>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>


namespace word_ladder {


namespace {


std::string trim(const std::string& line) {
    const auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = line.find_last_not_of(" \t\r\n");
    return line.substr(first, last - first + 1);
}


}  // namespace


Dictionary load_dictionary(std::istream& in, std::size_t word_length, LoadStats* stats) {
    Dictionary dictionary = word_length > 0 ? Dictionary(word_length) : Dictionary();
    LoadStats counters{};

    std::string line;
    while (std::getline(in, line)) {
        ++counters.lines;

        const auto word = trim(line);
        if (word.empty()) continue;

        if (!is_word(word) || (word_length > 0 && word.size() != word_length)) {
            ++counters.skipped;
            continue;
        }

        dictionary.insert(word);
        ++counters.accepted;
    }

    if (in.bad()) {
        throw std::runtime_error("Error while reading dictionary stream");
    }

    if (stats) *stats = counters;
    return dictionary;
}


Dictionary load_dictionary(const std::filesystem::path& path, std::size_t word_length, LoadStats* stats) {
    std::ifstream file(path);
    if (!file || std::filesystem::is_directory(path)) {
        throw std::runtime_error("Cannot open dictionary file: " + path.string());
    }
    return load_dictionary(file, word_length, stats);
}


void write_ladder(std::ostream& out, const std::optional<Ladder>& ladder) {
    if (!ladder) {
        out << kNoPathMessage << '\n';
        return;
    }
    for (const auto& word : *ladder) {
        out << word << '\n';
    }
}


void save_ladder(const std::filesystem::path& path, const std::optional<Ladder>& ladder) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open result file for writing: " + path.string());
    }

    write_ladder(file, ladder);
    file.flush();
    if (!file) {
        throw std::runtime_error("Failed to write result file: " + path.string());
    }
}


}  // namespace word_ladder
