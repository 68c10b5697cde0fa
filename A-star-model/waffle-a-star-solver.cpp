#include <optional>
#include <vector>

#include <stlastar.h>

#include "board.hpp"
#include "distance.hpp"
#include "logging.hpp"
#include "move_generator.hpp"
#include "waffle-a-star-solver.hpp"

// Board state type that implements the A* user-state interface
class SwapAStarState {
public:
    SwapAStarState() = default;
    SwapAStarState(const Board &board, const Board *target)
        : board_(board), target_(target) {}
    ~SwapAStarState() = default;

    // AStarState interface
    float GoalDistanceEstimate(SwapAStarState &nodeGoal);
    bool IsGoal(SwapAStarState &nodeGoal);
    bool GetSuccessors(AStarSearch<SwapAStarState> *astarsearch, SwapAStarState *parent_node);
    float GetCost(SwapAStarState &successor);
    bool IsSameState(SwapAStarState &rhs);
    size_t Hash();

    const Board& board() const { return board_; }

private:
    Board board_;
    const Board *target_ = nullptr;
};

float SwapAStarState::GoalDistanceEstimate(SwapAStarState &nodeGoal) {
    return static_cast<float>(swap_lower_bound(board_, nodeGoal.board_));
}

bool SwapAStarState::IsGoal(SwapAStarState &nodeGoal) {
    return IsSameState(nodeGoal);
}

bool SwapAStarState::GetSuccessors(AStarSearch<SwapAStarState> *astarsearch, SwapAStarState * /*parent_node*/) {
    int current = board_.distance(*target_);
    for (const Swap &swap : get_candidate_swaps(board_, *target_)) {
        Board next = board_.apply(swap);
        if (next.distance(*target_) >= current) continue;
        SwapAStarState tmp(next, target_);
        if (!astarsearch->AddSuccessor(tmp)) return false;
    }
    return true;
}

float SwapAStarState::GetCost(SwapAStarState & /*successor*/) {
    return 1.0f;
}

bool SwapAStarState::IsSameState(SwapAStarState &rhs) {
    return board_ == rhs.board_;
}

size_t SwapAStarState::Hash() {
    return board_.hash();
}

std::optional<std::vector<Swap>> SwapSolveAstar(const Board &start, const Board &goal, int max_nodes,
                                                int* visited_nodes) {
    if (start.distance(goal) == 0) {
        return std::vector<Swap>();
    }
    // Differing letters would leave boards one mismatch away from the goal
    if (!same_letters(start, goal)) {
        return std::nullopt;
    }

    SwapAStarState sstart(start, &goal);
    SwapAStarState sgoal(goal, &goal);

    AStarSearch<SwapAStarState> search(max_nodes);
    search.SetStartAndGoalStates(sstart, sgoal);

    unsigned int result = 0;
    do {
        result = search.SearchStep();
    } while (result == AStarSearch<SwapAStarState>::SEARCH_STATE_SEARCHING);

    if (visited_nodes) {
        *visited_nodes = search.GetStepCount();
    }

    if (result != AStarSearch<SwapAStarState>::SEARCH_STATE_SUCCEEDED) {
        if (result == AStarSearch<SwapAStarState>::SEARCH_STATE_OUT_OF_MEMORY) {
            waffle_logger()->warn("A* ran out of its {} node budget", max_nodes);
        }
        return std::nullopt;
    }

    // Consecutive boards on the solution differ in exactly the two swapped cells
    std::vector<Swap> path;
    SwapAStarState *prev = search.GetSolutionStart();
    SwapAStarState *p = search.GetSolutionNext();
    while (p) {
        std::vector<Coord> changed = prev->board().diff(p->board());
        path.emplace_back(changed[0], changed[1]);
        prev = p;
        p = search.GetSolutionNext();
    }

    search.FreeSolutionNodes();
    return path;
}
