#ifndef __DISTANCE_HPP___
#define __DISTANCE_HPP___

#include <map>

#include "board.hpp"

/**
 * @file distance.hpp
 * @brief Letter bookkeeping and heuristic bounds for swap searches.
 */

/**
 * @brief Count how many times every character occurs on the board.
 */
std::map<char, int> letter_counts(const Board& board);

/**
 * @brief Whether two boards hold the same multiset of characters.
 *
 * Swaps preserve the multiset, so a swap-only path between the boards can
 * exist only when this holds.
 */
bool same_letters(const Board& board, const Board& target);

/**
 * @brief Lower bound on the number of swaps needed to reach `target`.
 *
 * A swap changes two cells, so it fixes at most two mismatches; the bound is
 * ceil(distance / 2) and never overestimates.
 *
 * @throws DimensionMismatch if the boards have different dimensions.
 */
int swap_lower_bound(const Board& board, const Board& target);

#endif // __DISTANCE_HPP___
