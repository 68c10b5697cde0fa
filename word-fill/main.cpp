#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "board_file_operations.hpp"
#include "constraints.hpp"
#include "logging.hpp"
#include "waffle-word-fill-solver.hpp"

using namespace std;

static void print_usage(ostream &out) {
    out << "Usage: waffle-fill [--log-level LEVEL] <wordlist> <board>\n";
    out << "Options:\n";
    out << "  --log-level LEVEL     trace, debug, info, warn, error, critical or off (default: warn)\n";
}

int main(int argc, char** argv) {
    vector<string> positional;

    try {
        // Simple argument parsing
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--log-level" && i + 1 < argc) { set_log_level(argv[++i]); }
            else if (a == "--help") {
                print_usage(cout);
                return 0;
            }
            else if (a.size() > 1 && a[0] == '-') {
                cerr << "Unknown option: " << a << '\n';
                print_usage(cerr);
                return 1;
            }
            else { positional.push_back(a); }
        }
    } catch (const exception& e) {
        cerr << "Invalid argument: " << e.what() << '\n';
        return 2;
    }

    if (positional.size() != 2) {
        cerr << "Expected 2 command line arguments but got " << positional.size() << '\n';
        print_usage(cerr);
        return 1;
    }

    vector<string> wordlist;
    ConstraintBoard board;
    try {
        wordlist = read_wordlist_from_file(positional[0]);
        vector<string> lines = read_lines_from_file(positional[1]);
        if (lines.empty()) {
            throw invalid_argument("Expected at least one line in " + positional[1]);
        }
        board = ConstraintBoard(lines);
    } catch (const exception& e) {
        cerr << "Error loading inputs: " << e.what() << '\n';
        return 2;
    }

    for (const auto &solution : WordFillSolver(board, wordlist)) {
        cout << solution.to_string() << '\n' << '\n';
    }
    return 0;
}
