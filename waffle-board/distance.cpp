#include <map>

#include "board.hpp"
#include "distance.hpp"

using namespace std;

map<char, int> letter_counts(const Board& board) {
    map<char, int> counts;
    for (int row = 0; row < board.get_rows(); ++row) {
        for (int col = 0; col < board.get_cols(); ++col) {
            ++counts[board.get({row, col})];
        }
    }
    return counts;
}

bool same_letters(const Board& board, const Board& target) {
    return letter_counts(board) == letter_counts(target);
}

int swap_lower_bound(const Board& board, const Board& target) {
    return (board.distance(target) + 1) / 2;
}
