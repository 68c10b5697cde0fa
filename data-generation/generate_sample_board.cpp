#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "board.hpp"
#include "generate_sample_board.hpp"

using namespace std;

Board random_board(int rows, int cols, const string &alphabet, mt19937 &rng) {
    if (alphabet.empty()) {
        throw invalid_argument("Alphabet cannot be empty");
    }
    if (rows <= 0 || cols <= 0) {
        throw invalid_argument("Board dimensions must be positive");
    }
    uniform_int_distribution<size_t> dist(0, alphabet.size() - 1);
    vector<string> lines(rows, string(cols, ' '));
    for (auto &line : lines) {
        for (auto &c : line) c = alphabet[dist(rng)];
    }
    return Board(lines);
}

Board random_scramble(const Board &target, int swaps, mt19937 &rng) {
    vector<Coord> movable;
    for (int row = 0; row < target.get_rows(); ++row) {
        for (int col = 0; col < target.get_cols(); ++col) {
            if (target.get({row, col}) != ' ') movable.push_back({row, col});
        }
    }
    Board temp = target;
    if (movable.size() < 2) return temp;
    uniform_int_distribution<size_t> dist(0, movable.size() - 1);
    for (int i = 0; i < swaps; ++i) {
        size_t a = dist(rng);
        size_t b = dist(rng);
        while (b == a) b = dist(rng);
        temp = temp.apply(Swap(movable[a], movable[b]));
    }
    return temp;
}
