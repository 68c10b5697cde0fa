#ifndef __WAFFLE_BFS_SOLVER_HPP___
#define __WAFFLE_BFS_SOLVER_HPP___

#include <optional>
#include <vector>

#include "board.hpp"

/**
 * @file waffle-bfs-solver.hpp
 * @brief Exhaustive breadth-first swap solver (reference for small boards).
 */

/**
 * @brief Solve by BFS over every swap of any two distinct cells.
 *
 * No pruning beyond duplicate detection, so the first path found is a
 * shortest one. Only practical for small boards.
 *
 * @param start Starting board.
 * @param target Goal board.
 * @param max_depth Longest path explored.
 * @param visited_nodes Optional out-parameter to receive number of visited boards.
 * @return Swaps from start to target, or std::nullopt if none within `max_depth`.
 * @throws DimensionMismatch if the boards have different dimensions.
 */
std::optional<std::vector<Swap>> BFSSwapSolver(const Board &start, const Board &target, int max_depth = 10,
                                               int* visited_nodes = nullptr);

#endif // __WAFFLE_BFS_SOLVER_HPP___
