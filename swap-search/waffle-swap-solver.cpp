#include <algorithm>
#include <optional>
#include <queue>
#include <unordered_map>
#include <utility>
#include <vector>

#include "board.hpp"
#include "distance.hpp"
#include "logging.hpp"
#include "move_generator.hpp"
#include "waffle-swap-solver.hpp"

namespace {

typedef std::unordered_map<Board, std::vector<Swap>, BoardHash> BestPaths;

struct Node {
    int distance;
    std::vector<Swap> path;
    Board board;
};

// priority_queue pops the largest element, so "greater" means "explored later"
struct NodeCompare {
    bool operator()(const Node &a, const Node &b) const {
        if (a.distance != b.distance) return a.distance > b.distance;
        if (a.path.size() != b.path.size()) return a.path.size() > b.path.size();
        return std::lexicographical_compare(b.path.begin(), b.path.end(), a.path.begin(), a.path.end());
    }
};

typedef std::priority_queue<Node, std::vector<Node>, NodeCompare> Frontier;

} // namespace

std::optional<std::vector<Swap>> SwapSearchSolver(const Board &start, const Board &target,
                                                  const SwapSearchParams &params, SwapSearchStats *stats) {
    auto logger = waffle_logger();
    SwapSearchStats local_stats;
    SwapSearchStats &counters = stats ? *stats : local_stats;
    counters = SwapSearchStats();

    int start_distance = start.distance(target);
    if (start_distance == 0) {
        return std::vector<Swap>();
    }
    logger->info("searching {}x{} board, {} cells differ, depth bound {}",
                 start.get_rows(), start.get_cols(), start_distance, params.max_path_length);

    BestPaths best_paths;
    Frontier frontier;
    best_paths.emplace(start, std::vector<Swap>());
    counters.discovered_boards = 1;
    frontier.push({start_distance, {}, start});

    std::optional<std::vector<Swap>> best;

    while (!frontier.empty()) {
        Node current = frontier.top();
        frontier.pop();

        if (best_paths.at(current.board).size() < current.path.size()) {
            counters.stale_entries++;
            continue;
        }

        int path_length = static_cast<int>(current.path.size());
        if (current.distance == 0) {
            if (!best || path_length < static_cast<int>(best->size())) {
                best = current.path;
                counters.solutions_found++;
                logger->debug("found a path of {} swaps after {} expansions", path_length,
                              counters.expanded_boards);
            }
            continue;
        }
        if (best && path_length + swap_lower_bound(current.board, target) >= static_cast<int>(best->size())) {
            continue;
        }

        std::vector<Swap> moves;
        try {
            moves = get_candidate_swaps(current.board, target);
        } catch (const UnreachableBoard &e) {
            counters.dead_ends++;
            logger->debug("dead end: {}", e.what());
            continue;
        }
        counters.expanded_boards++;

        for (const Swap &swap : moves) {
            Board next = current.board.apply(swap);
            int next_distance = next.distance(target);
            if (next_distance >= current.distance) continue;

            if (path_length + 1 > params.max_path_length) {
                counters.abandoned_branches++;
                continue;
            }

            auto known = best_paths.find(next);
            if (known != best_paths.end() && static_cast<int>(known->second.size()) <= path_length + 1) {
                continue;
            }

            std::vector<Swap> next_path = current.path;
            next_path.push_back(swap);
            if (known == best_paths.end()) {
                best_paths.emplace(next, next_path);
                counters.discovered_boards++;
            } else {
                known->second = next_path;
            }
            if (params.enqueue_hook) {
                params.enqueue_hook(current.board, next);
            }
            frontier.push({next_distance, std::move(next_path), std::move(next)});
        }
    }

    if (best) {
        logger->info("shortest path has {} swaps ({} boards expanded, {} discovered)", best->size(),
                     counters.expanded_boards, counters.discovered_boards);
    } else {
        logger->info("no path found ({} boards expanded, {} branches over the depth bound)",
                     counters.expanded_boards, counters.abandoned_branches);
    }
    return best;
}
