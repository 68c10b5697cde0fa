#include <ostream>
#include <string>
#include <vector>

#include "board.hpp"
#include "path_player.hpp"

std::vector<Board> replay_path(const Board &start, const std::vector<Swap> &path) {
    std::vector<Board> boards;
    boards.reserve(path.size() + 1);
    boards.push_back(start);
    for (const Swap &swap : path) {
        boards.push_back(boards.back().apply(swap));
    }
    return boards;
}

std::string describe_swap(const Board &board, const Swap &swap) {
    const Coord &a = swap.get_first();
    const Coord &b = swap.get_second();
    return std::string("- swap '") + board.get(a) + "' at " + a.to_string()
           + " with '" + board.get(b) + "' at " + b.to_string();
}

void show_transformation(std::ostream &out, const Board &start, const std::vector<Swap> &path) {
    std::vector<Board> boards = replay_path(start, path);
    out << boards[0].to_string() << '\n';
    for (size_t i = 0; i < path.size(); ++i) {
        out << describe_swap(boards[i], path[i]) << '\n';
        out << boards[i + 1].to_string() << '\n';
    }
}
