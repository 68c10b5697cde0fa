#include <optional>
#include <queue>
#include <set>
#include <utility>
#include <vector>

#include "board.hpp"
#include "distance.hpp"

#include "waffle-bfs-solver.hpp"

std::optional<std::vector<Swap>> BFSSwapSolver(const Board &start, const Board &target, int max_depth,
                                               int* visited_nodes) {
    if (start.distance(target) == 0) {
        return std::vector<Swap>();
    }
    // Swaps preserve the letters, so the search would only exhaust the space
    if (!same_letters(start, target)) {
        return std::nullopt;
    }

    std::vector<Swap> all_swaps;
    for (int a = 0; a < start.get_rows() * start.get_cols(); ++a) {
        for (int b = a + 1; b < start.get_rows() * start.get_cols(); ++b) {
            all_swaps.emplace_back(Coord{a / start.get_cols(), a % start.get_cols()},
                                   Coord{b / start.get_cols(), b % start.get_cols()});
        }
    }

    std::queue<std::pair<Board, std::vector<Swap>>> frontier;
    std::set<Board> explored;
    frontier.push({start, {}});
    explored.insert(start);
    while (!frontier.empty()) {
        auto current = frontier.front();
        frontier.pop();
        Board board = current.first;
        std::vector<Swap> current_path = current.second;

        if (visited_nodes) {
            (*visited_nodes)++;
        }
        if (static_cast<int>(current_path.size()) >= max_depth) continue;

        for (const auto &swap : all_swaps) {
            if (board.get(swap.get_first()) == board.get(swap.get_second())) continue;
            Board next = board.apply(swap);
            if (explored.find(next) != explored.end()) continue;
            std::vector<Swap> new_path = current_path;
            new_path.push_back(swap);
            if (next == target) {
                return new_path;
            }
            explored.insert(next);
            frontier.push({next, new_path});
        }
    }
    return std::nullopt;
}
