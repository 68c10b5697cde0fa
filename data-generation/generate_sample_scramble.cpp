#include <iostream>
#include <random>
#include <string>

#include "board.hpp"
#include "board_file_operations.hpp"
#include "generate_sample_board.hpp"

using namespace std;

int main(int argc, char** argv) {
    int swaps = 10;
    unsigned int seed = 0;
    string input_file;
    string output_file;

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--swaps" && i + 1 < argc) { swaps = stoi(argv[++i]); }
        else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
        else if (a == "--input-file" && i + 1 < argc) { input_file = argv[++i]; }
        else if (a == "--output-file" && i + 1 < argc) { output_file = argv[++i]; }
        else if (a == "--help") {
            cout << "Usage: generate-sample-scramble --input-file FILE --output-file FILE [--swaps K] [--seed S]\n";
            return 0;
        }
    }
    if (input_file.empty() || output_file.empty()) {
        cerr << "Usage: generate-sample-scramble --input-file FILE --output-file FILE [--swaps K] [--seed S]\n";
        return 1;
    }

    try {
        Board target = read_board_from_file(input_file);
        mt19937 rng(seed);
        write_board_to_file(random_scramble(target, swaps, rng), output_file);
    } catch (const std::exception& e) {
        cerr << "Error generating sample: " << e.what() << '\n';
        return 2;
    }
    return 0;
}
