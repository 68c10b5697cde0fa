// Google Test for SwapSearchSolver
#include <gtest/gtest.h>
#include <random>
#include <string>
#include <vector>

#include "board.hpp"
#include "generate_sample_board.hpp"
#include "path_player.hpp"
#include "waffle-bfs-solver.hpp"
#include "waffle-swap-solver.hpp"

static Board apply_all(Board board, const std::vector<Swap> &path) {
    for (const auto &swap : path) board = board.apply(swap);
    return board;
}

TEST(SwapSolver, OneSwapSolution) {
    Board start({"ab", "cd"});
    Board target({"ba", "cd"});

    auto path = SwapSearchSolver(start, target);

    ASSERT_TRUE(path.has_value());
    std::vector<Swap> expected = {Swap({0, 0}, {0, 1})};
    EXPECT_EQ(*path, expected);
}

TEST(SwapSolver, RowsExchangedNeedTwoSwaps) {
    Board start({"ab", "cd"});
    Board target({"cd", "ab"});

    auto path = SwapSearchSolver(start, target);

    ASSERT_TRUE(path.has_value());
    std::vector<Swap> expected = {Swap({0, 0}, {1, 0}), Swap({0, 1}, {1, 1})};
    EXPECT_EQ(*path, expected);
    EXPECT_EQ(apply_all(start, *path), target);
}

TEST(SwapSolver, IdentityIsEmptyPath) {
    Board board({"waffle", "abcdef"});

    auto path = SwapSearchSolver(board, board);

    ASSERT_TRUE(path.has_value());
    EXPECT_TRUE(path->empty());
}

TEST(SwapSolver, DisjointLettersHaveNoSolution) {
    SwapSearchStats stats;
    EXPECT_FALSE(SwapSearchSolver(Board({"aa"}), Board({"bb"}), SwapSearchParams(), &stats).has_value());
    EXPECT_EQ(stats.abandoned_branches, 0);
}

TEST(SwapSolver, DifferentLettersEndInDeadEnd) {
    SwapSearchStats stats;
    // every improving swap leads towards a single leftover mismatch
    EXPECT_FALSE(SwapSearchSolver(Board({"abc"}), Board({"bcd"}), SwapSearchParams(), &stats).has_value());
    EXPECT_GT(stats.dead_ends, 0);
    EXPECT_EQ(stats.abandoned_branches, 0);
}

TEST(SwapSolver, DifferentSizesThrow) {
    EXPECT_THROW(SwapSearchSolver(Board({"ab"}), Board({"a", "b"})), DimensionMismatch);
}

TEST(SwapSolver, DepthBoundAbandonsBranches) {
    Board start({"ab", "cd"});
    Board target({"cd", "ab"});
    SwapSearchParams params;
    params.max_path_length = 1;
    SwapSearchStats stats;

    EXPECT_FALSE(SwapSearchSolver(start, target, params, &stats).has_value());
    EXPECT_GT(stats.abandoned_branches, 0);

    params.max_path_length = 2;
    auto path = SwapSearchSolver(start, target, params);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->size(), 2u);
}

TEST(SwapSolver, FourCycleNeedsThreeSwaps) {
    Board start({"ab", "cd"});
    Board target({"ca", "db"});

    auto path = SwapSearchSolver(start, target);

    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->size(), 3u);
    EXPECT_EQ(apply_all(start, *path), target);
}

TEST(SwapSolver, EveryEnqueuedBoardImproves) {
    Board target({"chase", "o b v", "alone", "s v n", "tweet"});
    Board start({"tnase", "o b s", "alohe", "v v n", "tweec"});
    SwapSearchParams params;
    int enqueued = 0;
    params.enqueue_hook = [&](const Board &parent, const Board &child) {
        ++enqueued;
        EXPECT_LT(child.distance(target), parent.distance(target));
    };

    auto path = SwapSearchSolver(start, target, params);

    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->size(), 3u);
    EXPECT_GT(enqueued, 0);
}

TEST(SwapSolver, RepeatedRunsGiveSamePath) {
    std::mt19937 rng(7);
    Board target({"aabbc", "cddee"});
    for (int i = 0; i < 20; ++i) {
        Board start = random_scramble(target, 6, rng);
        auto first = SwapSearchSolver(start, target);
        auto second = SwapSearchSolver(start, target);
        ASSERT_TRUE(first.has_value());
        EXPECT_EQ(*first, *second);
    }
}

TEST(SwapSolver, ReplayingThePathReachesTarget) {
    std::mt19937 rng(11);
    Board target({"slept", "e a o", "abate", "c s t", "tests"});
    for (int i = 0; i < 10; ++i) {
        Board start = random_scramble(target, 5, rng);
        auto path = SwapSearchSolver(start, target);
        ASSERT_TRUE(path.has_value());
        EXPECT_LE(path->size(), 5u);
        std::vector<Board> boards = replay_path(start, *path);
        EXPECT_EQ(boards.front(), start);
        EXPECT_EQ(boards.back(), target);
    }
}

TEST(SwapSolver, MatchesExhaustiveSearchOnSmallBoards) {
    std::mt19937 rng(2024);
    const std::vector<std::string> alphabets = {"ab", "abc", "abcdef"};
    for (const auto &alphabet : alphabets) {
        for (int i = 0; i < 25; ++i) {
            Board target = random_board(2, 3, alphabet, rng);
            Board start = random_scramble(target, 6, rng);

            auto path = SwapSearchSolver(start, target);
            auto reference = BFSSwapSolver(start, target);

            ASSERT_TRUE(path.has_value());
            ASSERT_TRUE(reference.has_value());
            EXPECT_EQ(path->size(), reference->size())
                << "start:\n" << start.to_string() << "\ntarget:\n" << target.to_string();
            EXPECT_EQ(apply_all(start, *path), target);
        }
    }
}

TEST(SwapSolver, RandomLetterMismatchNeverReturnsAPath) {
    std::mt19937 rng(5);
    for (int i = 0; i < 20; ++i) {
        Board target = random_board(2, 3, "abc", rng);
        std::vector<std::string> lines = random_scramble(target, 4, rng).get_lines();
        lines[1][2] = 'z';
        EXPECT_FALSE(SwapSearchSolver(Board(lines), target).has_value());
    }
}
