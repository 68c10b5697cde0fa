#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "board.hpp"
#include "board_file_operations.hpp"
#include "logging.hpp"
#include "path_player.hpp"
#include "waffle-swap-solver.hpp"

using namespace std;

static void print_usage(ostream &out) {
    out << "Usage: waffle-swaps [--max-depth N] [--log-level LEVEL] <from-board> <to-board>\n";
    out << "Options:\n";
    out << "  --max-depth N         Longest swap path explored (default: 10)\n";
    out << "  --log-level LEVEL     trace, debug, info, warn, error, critical or off (default: warn)\n";
}

int main(int argc, char** argv) {
    SwapSearchParams params;
    vector<string> positional;

    try {
        // Simple argument parsing
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if ((a == "--max-depth" || a == "--log-level") && i + 1 >= argc) {
                cerr << "Missing value for " << a << '\n';
                print_usage(cerr);
                return 1;
            }
            if (a == "--max-depth" && i + 1 < argc) { params.max_path_length = stoi(argv[++i]); }
            else if (a == "--log-level" && i + 1 < argc) { set_log_level(argv[++i]); }
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
    if (params.max_path_length < 0) {
        cerr << "--max-depth must be non-negative\n";
        return 2;
    }

    Board from_board;
    Board into_board;
    try {
        from_board = read_board_from_file(positional[0]);
        into_board = read_board_from_file(positional[1]);
        if (from_board.get_rows() != into_board.get_rows() || from_board.get_cols() != into_board.get_cols()) {
            throw DimensionMismatch("Boards have different sizes: "
                                    + to_string(from_board.get_rows()) + "x" + to_string(from_board.get_cols())
                                    + " vs " + to_string(into_board.get_rows()) + "x"
                                    + to_string(into_board.get_cols()));
        }
    } catch (const exception& e) {
        cerr << "Error loading boards: " << e.what() << '\n';
        return 2;
    }

    auto path = SwapSearchSolver(from_board, into_board, params);
    if (path) {
        show_transformation(cout, from_board, *path);
    } else {
        cout << "Could not find a path." << '\n';
    }
    return 0;
}
