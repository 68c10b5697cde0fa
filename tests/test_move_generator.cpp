// Google Test for get_candidate_swaps
#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include <vector>

#include "board.hpp"
#include "move_generator.hpp"

TEST(CandidateSwaps, EqualBoardsHaveNoMoves) {
    Board b({"ab", "cd"});
    EXPECT_TRUE(get_candidate_swaps(b, b).empty());
}

TEST(CandidateSwaps, SingleMismatchIsUnreachable) {
    Board current({"ab", "cd"});
    Board target({"ab", "ce"});
    EXPECT_THROW(get_candidate_swaps(current, target), UnreachableBoard);
}

TEST(CandidateSwaps, TwoMismatchesGiveOneSwap) {
    Board current({"ab", "cd"});
    Board target({"ba", "cd"});

    auto moves = get_candidate_swaps(current, target);
    ASSERT_EQ(moves.size(), 1u);
    EXPECT_EQ(moves[0], Swap({0, 0}, {0, 1}));
}

TEST(CandidateSwaps, AllPairsOfMismatchesSortedAndUnique) {
    Board current({"abc", "def"});
    Board target({"xbz", "yez"});
    // mismatches: (0,0), (0,2), (1,0), (1,2)

    auto moves = get_candidate_swaps(current, target);
    std::vector<Swap> expected = {
        Swap({0, 0}, {0, 2}), Swap({0, 0}, {1, 0}), Swap({0, 0}, {1, 2}),
        Swap({0, 2}, {1, 0}), Swap({0, 2}, {1, 2}), Swap({1, 0}, {1, 2}),
    };
    EXPECT_EQ(moves, expected);
    EXPECT_TRUE(std::is_sorted(moves.begin(), moves.end()));
    std::set<Swap> unique_moves(moves.begin(), moves.end());
    EXPECT_EQ(unique_moves.size(), moves.size());
}

TEST(CandidateSwaps, NeverTouchesMatchingCells) {
    Board current({"abcde"});
    Board target({"aecdb"});

    for (const auto &swap : get_candidate_swaps(current, target)) {
        EXPECT_NE(current.get(swap.get_first()), target.get(swap.get_first()));
        EXPECT_NE(current.get(swap.get_second()), target.get(swap.get_second()));
    }
}

TEST(CandidateSwaps, DifferentSizesThrow) {
    EXPECT_THROW(get_candidate_swaps(Board({"ab"}), Board({"a", "b"})), DimensionMismatch);
}
