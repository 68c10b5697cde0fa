#ifndef WAFFLE_ASTAR_SOLVER_HPP
#define WAFFLE_ASTAR_SOLVER_HPP

#include <optional>
#include <vector>

#include "board.hpp"

/**
 * @file waffle-a-star-solver.hpp
 * @brief A* solver adapter for Waffle boards, on top of stlastar.
 */

/**
 * @brief Solve the swap puzzle using A* with the ceil(distance / 2) heuristic.
 *
 * @param start Starting board.
 * @param goal Goal board.
 * @param max_nodes Node budget handed to the A* allocator.
 * @param visited_nodes Optional out-parameter to receive number of search steps.
 * @return Swaps from start to goal, or std::nullopt if no solution was found.
 */
std::optional<std::vector<Swap>> SwapSolveAstar(const Board &start, const Board &goal, int max_nodes = 100000,
                                                int* visited_nodes = nullptr);

#endif // WAFFLE_ASTAR_SOLVER_HPP
