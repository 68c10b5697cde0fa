#ifndef __PATH_PLAYER_HPP___
#define __PATH_PLAYER_HPP___

#include <ostream>
#include <string>
#include <vector>

#include "board.hpp"

/**
 * @file path_player.hpp
 * @brief Replay and print a swap path step by step.
 */

/**
 * @brief Boards visited while applying `path` to `start`.
 *
 * @return `start` followed by the board after each swap, in order
 *         (path.size() + 1 boards).
 * @throws OutOfBounds if a swap leaves the board.
 */
std::vector<Board> replay_path(const Board &start, const std::vector<Swap> &path);

/**
 * @brief One-line description of a swap on `board`, e.g.
 * `- swap 'a' at (0,0) with 'b' at (0,1)`.
 */
std::string describe_swap(const Board &board, const Swap &swap);

/**
 * @brief Print `start`, then for each swap its description and the board it produces.
 */
void show_transformation(std::ostream &out, const Board &start, const std::vector<Swap> &path);

#endif // __PATH_PLAYER_HPP___
