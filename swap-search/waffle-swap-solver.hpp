#ifndef WAFFLE_SWAP_SOLVER_HPP
#define WAFFLE_SWAP_SOLVER_HPP

#include <functional>
#include <optional>
#include <vector>

#include "board.hpp"

/**
 * @file waffle-swap-solver.hpp
 * @brief Best-first minimum-swap search between two Waffle boards.
 */

/**
 * @brief Search parameters.
 * @var max_path_length Longest swap path explored; longer branches are abandoned.
 * @var enqueue_hook Called with (parent, child) for every board put on the frontier.
 */
struct SwapSearchParams {
    int max_path_length;       // Depth bound (circuit breaker)
    std::function<void(const Board &, const Board &)> enqueue_hook;

    SwapSearchParams() :
        max_path_length(10) {}
};

/**
 * @brief Counters filled in by a search.
 */
struct SwapSearchStats {
    int expanded_boards = 0;      // Frontier entries expanded
    int discovered_boards = 0;    // Distinct boards entered in the best-path map
    int abandoned_branches = 0;   // Children dropped by the depth bound
    int stale_entries = 0;        // Entries superseded by a shorter path
    int dead_ends = 0;            // Boards one mismatch away from the target
    int solutions_found = 0;      // Times the best solution improved
};

/**
 * @brief Find the shortest sequence of swaps turning `start` into `target`.
 *
 * The frontier is ordered by distance to the target, then path length, then
 * the path itself. Only swaps between mismatched cells that strictly reduce
 * the distance are explored, and a board is re-entered only through a
 * strictly shorter path. Once a path is found, entries that cannot beat it
 * (path length plus swap_lower_bound) are pruned and the search runs until
 * the frontier is empty.
 *
 * @param start Starting board.
 * @param target Goal board.
 * @param params Search parameters.
 * @param stats Optional out-parameter to receive search counters.
 * @return The swaps in application order (empty if `start == target`), or
 *         std::nullopt if no path exists within the depth bound.
 * @throws DimensionMismatch if the boards have different dimensions.
 */
std::optional<std::vector<Swap>> SwapSearchSolver(const Board &start, const Board &target,
                                                  const SwapSearchParams &params = SwapSearchParams(),
                                                  SwapSearchStats *stats = nullptr);

#endif // WAFFLE_SWAP_SOLVER_HPP
