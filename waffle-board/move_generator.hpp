#ifndef __MOVE_GENERATOR_HPP___
#define __MOVE_GENERATOR_HPP___

#include <stdexcept>
#include <vector>

#include "board.hpp"

/**
 * @file move_generator.hpp
 * @brief Candidate swaps between a board and its target.
 */

/**
 * @brief Raised for a board that differs from its target in exactly one cell.
 *
 * No swap of two cells can fix a single mismatch, so such a pair is not
 * connected by content-preserving swaps.
 */
class UnreachableBoard : public std::domain_error {
public:
    using std::domain_error::domain_error;
};

/**
 * @brief Propose every swap worth exploring from `current` towards `target`.
 *
 * Only pairs of currently mismatched cells are proposed. Each unordered pair
 * appears once and the result is sorted by the canonical swap ordering.
 *
 * @param current Board being expanded.
 * @param target Goal board.
 * @return Sorted candidate swaps; empty when `current == target`.
 * @throws UnreachableBoard if exactly one cell differs.
 * @throws DimensionMismatch if the boards have different dimensions.
 */
std::vector<Swap> get_candidate_swaps(const Board &current, const Board &target);

#endif // __MOVE_GENERATOR_HPP___
