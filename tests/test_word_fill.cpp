// Google Test for the word-fill solver
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "constraints.hpp"
#include "waffle-word-fill-solver.hpp"

TEST(ConstraintTest, MatchesFixedLetters) {
    Constraint c("a??le");

    EXPECT_TRUE(c.matches("apple"));
    EXPECT_TRUE(c.matches("addle"));
    EXPECT_FALSE(c.matches("ampre"));
    EXPECT_FALSE(c.matches("apply"));
    // too short to hold index 4
    EXPECT_FALSE(c.matches("abl"));
    EXPECT_EQ(c.num_set(), 3);
    EXPECT_EQ(c.get(0), 'a');
    EXPECT_FALSE(c.get(1).has_value());
    EXPECT_EQ(c.with(1, 'p').num_set(), 4);
    EXPECT_EQ(c.num_set(), 3);
}

TEST(LetterPoolTest, WithoutReturnsNewPool) {
    LetterPool pool("aab");
    LetterPool fewer = pool.without('a');

    EXPECT_EQ(pool.count('a'), 2);
    EXPECT_EQ(fewer.count('a'), 1);
    EXPECT_EQ(fewer.size(), 2);
    EXPECT_FALSE(fewer.without('a').contains('a'));
    EXPECT_TRUE(LetterPool("b").without('b').empty());
    EXPECT_THROW(pool.without('z'), std::invalid_argument);
    EXPECT_TRUE(pool == LetterPool("aba"));
}

TEST(ConstraintBoardTest, ParsesFixedLettersAndPool) {
    ConstraintBoard board({"Cat", "o.o", "woE"});

    EXPECT_EQ(board.get_side_length(), 3);
    EXPECT_EQ(board.get(0, 0), 'c');
    EXPECT_EQ(board.get(2, 2), 'e');
    EXPECT_FALSE(board.get(0, 1).has_value());
    EXPECT_TRUE(board.is_block(1, 1));
    EXPECT_FALSE(board.get(1, 1).has_value());
    // c and e are already placed
    EXPECT_EQ(board.get_unused(), LetterPool("atoowo"));
    EXPECT_EQ(board.get_open_words().size(), 4u);
    EXPECT_EQ(board.to_string(), "c  \n   \n  e");
}

TEST(ConstraintBoardTest, MalformedGridsThrow) {
    EXPECT_THROW(ConstraintBoard({"ab", "cd"}), std::invalid_argument);
    EXPECT_THROW(ConstraintBoard({"abc", "def"}), std::invalid_argument);
    EXPECT_THROW(ConstraintBoard({"abc", "dEf", "ghi"}), std::invalid_argument);
}

TEST(ConstraintBoardTest, WithChecksPoolAndConflicts) {
    ConstraintBoard board({"Cat", "o.o", "woE"});

    auto placed = board.with(0, 2, 't');
    ASSERT_TRUE(placed.has_value());
    EXPECT_EQ(placed->get(0, 2), 't');
    EXPECT_EQ(placed->get_unused().count('t'), 0);
    // not in the pool any more
    EXPECT_FALSE(placed->with(2, 0, 't').has_value());
    // same letter again is a no-op
    auto again = placed->with(0, 2, 't');
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->get_unused(), placed->get_unused());
    EXPECT_THROW(placed->with(0, 2, 'a'), std::invalid_argument);
    EXPECT_THROW(board.with(1, 1, 'o'), std::invalid_argument);
}

TEST(ConstraintBoardTest, CornerLetterSetsRowAndColumn) {
    ConstraintBoard board({"Cat", "o.o", "woE"});

    auto placed = board.with(0, 2, 't');
    ASSERT_TRUE(placed.has_value());
    for (const auto &slot : placed->get_open_words()) {
        if (slot.cells.front().col == 2 && slot.cells.back().col == 2) {
            EXPECT_TRUE(slot.constraint.matches("toe"));
            EXPECT_FALSE(slot.constraint.matches("woe"));
        }
    }
}

TEST(WordFill, PlaceWordWalksEveryCell) {
    ConstraintBoard board({"Cat", "o.o", "woE"});
    std::vector<Coord> row0 = {{0, 0}, {0, 1}, {0, 2}};

    auto placed = place_word(board, "cat", row0);
    ASSERT_TRUE(placed.has_value());
    EXPECT_EQ(placed->get_lines()[0], "cat");
    EXPECT_FALSE(place_word(board, "czt", row0).has_value());
    EXPECT_THROW(place_word(board, "cats", row0), std::invalid_argument);
}

TEST(WordFill, FindsEveryFillInOrder) {
    ConstraintBoard board({"Cat", "o.o", "woE"});
    std::vector<std::string> wordlist = {"cat", "cow", "toe", "woe", "owe", "ate", "oboe"};
    int visited = 0;

    auto fills = WordFillSolver(board, wordlist, &visited);

    ASSERT_EQ(fills.size(), 2u);
    EXPECT_EQ(fills[0].get_lines(), (std::vector<std::string>{"cat", "o o", "woe"}));
    EXPECT_EQ(fills[1].get_lines(), (std::vector<std::string>{"cow", "a o", "toe"}));
    EXPECT_TRUE(fills[0].get_unused().empty());
    EXPECT_TRUE(fills[1].get_unused().empty());
    EXPECT_GT(visited, 1);
}

TEST(WordFill, UniqueFillWithoutAlternativeWords) {
    ConstraintBoard board({"Cat", "o.o", "woE"});

    auto fills = WordFillSolver(board, {"cat", "toe", "woe"});

    ASSERT_EQ(fills.size(), 1u);
    EXPECT_EQ(fills[0].to_string(), "cat\no o\nwoe");
}

TEST(WordFill, NoMatchingWords) {
    ConstraintBoard board({"Cat", "o.o", "woE"});

    EXPECT_TRUE(WordFillSolver(board, {"dog", "ant"}).empty());
}

TEST(WordFill, CompleteBoardIsItsOwnFill) {
    ConstraintBoard board({"CAT", "O.O", "WOE"});

    auto fills = WordFillSolver(board, {});
    ASSERT_EQ(fills.size(), 1u);
    EXPECT_EQ(fills[0].to_string(), "cat\no o\nwoe");
}
