// Google Test for SwapSolveAstar
#include <gtest/gtest.h>
#include <random>
#include <vector>

#include "board.hpp"
#include "generate_sample_board.hpp"
#include "waffle-a-star-solver.hpp"
#include "waffle-swap-solver.hpp"

TEST(AStarSolver, OneSwapSolution) {
    auto path = SwapSolveAstar(Board({"ab", "cd"}), Board({"ba", "cd"}));

    ASSERT_TRUE(path.has_value());
    std::vector<Swap> expected = {Swap({0, 0}, {0, 1})};
    EXPECT_EQ(*path, expected);
}

TEST(AStarSolver, IdentityAndMismatchedLetters) {
    auto identity = SwapSolveAstar(Board({"abc"}), Board({"abc"}));
    ASSERT_TRUE(identity.has_value());
    EXPECT_TRUE(identity->empty());

    EXPECT_FALSE(SwapSolveAstar(Board({"aa"}), Board({"bb"})).has_value());
}

TEST(AStarSolver, AgreesWithSwapSearchOnLength) {
    std::mt19937 rng(99);
    Board target({"chase", "o b v", "alone", "s v n", "tweet"});
    for (int i = 0; i < 10; ++i) {
        Board start = random_scramble(target, 4, rng);
        auto a_star = SwapSolveAstar(start, target);
        auto best_first = SwapSearchSolver(start, target);

        ASSERT_TRUE(a_star.has_value());
        ASSERT_TRUE(best_first.has_value());
        EXPECT_EQ(a_star->size(), best_first->size());

        Board board = start;
        for (const auto &swap : *a_star) board = board.apply(swap);
        EXPECT_EQ(board, target);
    }
}
