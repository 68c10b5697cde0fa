#ifndef __GENERATE_SAMPLE_BOARD_HPP___
#define __GENERATE_SAMPLE_BOARD_HPP___

#include <random>
#include <string>

#include "board.hpp"

/**
 * @file generate_sample_board.hpp
 * @brief Utilities to create random boards for benchmarks and testing.
 *
 * Two generators are provided:
 * - random board: every cell drawn uniformly from an alphabet
 * - random scramble: apply `swaps` random swaps to a given board
 */

/**
 * @brief Generate a rows x cols board with letters drawn uniformly from `alphabet`.
 *
 * @throws std::invalid_argument if the alphabet is empty or a dimension is not positive.
 */
Board random_board(int rows, int cols, const std::string &alphabet, std::mt19937 &rng);

/**
 * @brief Scramble a board by a random walk of swaps.
 *
 * Each step swaps two distinct cells chosen uniformly among the cells that
 * are not blank (' '), so Waffle block cells stay in place. The result is at
 * most `swaps` swaps away from `target`.
 *
 * @param target Board to scramble.
 * @param swaps Number of random swaps to perform.
 * @param rng Random number generator to use (std::mt19937).
 * @return The scrambled `Board` (equal to `target` if fewer than two cells are not blank).
 */
Board random_scramble(const Board &target, int swaps, std::mt19937 &rng);

#endif // __GENERATE_SAMPLE_BOARD_HPP___
