#include <path_finder.hpp>
#include <word_io.hpp>

#include <exception>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>


namespace {


constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;


void print_usage(std::ostream& out, const char* program) {
    out << "Usage: " << program << " <dictionary_file> <start_word> <end_word> <result_file>\n"
        << "\n"
        << "Find the shortest path of words between two words that differ by only one letter.\n"
        << "\n"
        << "  dictionary_file  text file containing one word per line\n"
        << "  start_word       word to start the ladder from\n"
        << "  end_word         word to end the ladder with\n"
        << "  result_file      file that receives the ladder, one word per line" << std::endl;
}


void print_ladder(const word_ladder::Ladder& ladder) {
    std::cout << "Path found:" << std::endl;
    std::cout << "* steps = " << ladder.size() - 1 << std::endl;
    std::cout << "* sequence = [";
    for (auto it = ladder.begin(); it != ladder.end(); ++it) {
        std::cout << *it;
        if (std::next(it) != ladder.end())
            std::cout << ", ";
    }
    std::cout << "]" << std::endl;
}


}  // namespace


int main(int argc, char* argv[]) {
    if (argc == 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        print_usage(std::cout, argv[0]);
        return kExitOk;
    }
    if (argc != 5) {
        print_usage(std::cerr, argv[0]);
        return kExitUsage;
    }

    const std::string dictionary_file = argv[1];
    const std::string start_word = argv[2];
    const std::string end_word = argv[3];
    const std::string result_file = argv[4];

    try {
        word_ladder::LoadStats stats{};
        auto dictionary = word_ladder::load_dictionary(dictionary_file, 0, &stats);
        std::cout << "Loaded dictionary '" << dictionary_file << "' with " << dictionary.size() << " words ("
                  << stats.skipped << " entries skipped)" << std::endl;

        for (const auto& word : {start_word, end_word}) {
            if (!dictionary.contains(word)) {
                std::cout << "'" << word << "' is not contained in the source file, searching from it anyway" << std::endl;
            }
        }

        const word_ladder::PathFinder finder(std::move(dictionary));
        const auto ladder = finder.solve(start_word, end_word);

        if (ladder) {
            print_ladder(*ladder);
        } else {
            std::cout << "No path from '" << start_word << "' to '" << end_word << "' found." << std::endl;
        }

        word_ladder::save_ladder(result_file, ladder);
        std::cout << "Result written to '" << result_file << "'" << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid input: " << e.what() << std::endl;
        return kExitFailure;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailure;
    }

    return kExitOk;
}
