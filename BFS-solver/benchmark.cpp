#include <iostream>
#include <vector>
#include <chrono>
#include <string>

#include "board.hpp"
#include "board_file_operations.hpp"
#include "waffle-bfs-solver.hpp"

using namespace std;

int main(int argc, char** argv) {
    string from_file;
    string to_file;
    int max_depth = 10;

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--from" && i + 1 < argc) { from_file = argv[++i]; }
        else if (a == "--to" && i + 1 < argc) { to_file = argv[++i]; }
        else if (a == "--max-depth" && i + 1 < argc) { max_depth = stoi(argv[++i]); }
        else if (a == "--help") {
            cout << "Usage: benchmark-bfs --from FILE --to FILE [--max-depth N]\n";
            return 0;
        }
    }
    if (from_file.empty() || to_file.empty()) {
        cerr << "Usage: benchmark-bfs --from FILE --to FILE [--max-depth N]\n";
        return 1;
    }

    Board start_board;
    Board goal_board;
    try {
        start_board = read_board_from_file(from_file);
        goal_board = read_board_from_file(to_file);
    } catch (const std::exception& e) {
        cerr << "Error loading boards: " << e.what() << '\n';
        return 2;
    }

    auto t0 = chrono::steady_clock::now();
    int visited_nodes = 0;
    auto path = BFSSwapSolver(start_board, goal_board, max_depth, &visited_nodes);
    auto t1 = chrono::steady_clock::now();
    double ms = chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();

    bool found = path.has_value();
    size_t plen = found ? path->size() : 0;

    cout << start_board.get_rows() << "x" << start_board.get_cols() << ", time: " << ms << "ms, solution found: "
         << (found?1:0) << ", swaps: " << plen << ", visited nodes: " << visited_nodes << '\n';

    return 0;
}
