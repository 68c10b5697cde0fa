#include <iostream>
#include <vector>
#include <random>
#include <chrono>
#include <string>

#include "board.hpp"
#include "board_file_operations.hpp"
#include "generate_sample_board.hpp"
#include "logging.hpp"
#include "waffle-bfs-solver.hpp"
#include "waffle-swap-solver.hpp"

using namespace std;

int main(int argc, char** argv) {
    string input_file;
    int swaps = 10;
    int instances = 1;
    bool verify_bfs = false;
    SwapSearchParams params;
    unsigned int seed = (unsigned int)chrono::high_resolution_clock::now().time_since_epoch().count();

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--input-file" && i + 1 < argc) { input_file = argv[++i]; }
        else if (a == "--swaps" && i + 1 < argc) { swaps = stoi(argv[++i]); }
        else if (a == "--instances" && i + 1 < argc) { instances = stoi(argv[++i]); }
        else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
        else if (a == "--max-depth" && i + 1 < argc) { params.max_path_length = stoi(argv[++i]); }
        else if (a == "--log-level" && i + 1 < argc) { set_log_level(argv[++i]); }
        else if (a == "--verify-bfs") { verify_bfs = true; }
        else if (a == "--help") {
            cout << "Usage: benchmark-swap-search --input-file FILE [--swaps K] [--instances N] [--seed S]"
                    " [--max-depth D] [--verify-bfs]\n";
            return 0;
        }
    }
    if (input_file.empty()) {
        cerr << "Usage: benchmark-swap-search --input-file FILE [--swaps K] [--instances N] [--seed S]\n";
        return 1;
    }

    Board target;
    try {
        target = read_board_from_file(input_file);
    } catch (const std::exception& e) {
        cerr << "Error loading board: " << e.what() << '\n';
        return 2;
    }

    mt19937 rng(seed);

    // CSV header
    cout << "instance_id,seed,distance,time_ms,found,path_length,expanded,discovered,bfs_path_length" << '\n';

    int mismatches = 0;
    for (int instance = 0; instance < instances; ++instance) {
        Board start = random_scramble(target, swaps, rng);

        auto t0 = chrono::steady_clock::now();
        SwapSearchStats stats;
        auto path = SwapSearchSolver(start, target, params, &stats);
        auto t1 = chrono::steady_clock::now();
        double ms = chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();

        bool found = path.has_value();
        size_t plen = found ? path->size() : 0;

        string bfs_len = "";
        if (verify_bfs) {
            auto reference = BFSSwapSolver(start, target, params.max_path_length);
            bfs_len = reference ? to_string(reference->size()) : "none";
            if (reference.has_value() != found || (found && reference->size() != plen)) {
                ++mismatches;
            }
        }

        cout << instance << ',' << seed << ',' << start.distance(target) << ',' << ms << ',' << (found?1:0) << ','
             << plen << ',' << stats.expanded_boards << ',' << stats.discovered_boards << ',' << bfs_len << '\n';
    }

    if (mismatches) {
        cerr << mismatches << " instance(s) disagree with BFS\n";
        return 3;
    }
    return 0;
}
