/**
 * @file constraints.hpp
 * @brief Letter constraints for filling a Waffle grid with words.
 *
 * A Waffle grid of side 2n-1 holds n horizontal words (even rows) and n
 * vertical words (even columns); cells with an odd row and an odd column are
 * blocks. Letters fixed in the grid are tracked per word, and the letters not
 * yet placed are kept in an immutable pool.
 */

#ifndef __CONSTRAINTS_HPP___
#define __CONSTRAINTS_HPP___

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "board.hpp"

using namespace std;

/**
 * @brief Letters fixed at some indices of one word.
 */
class Constraint {

private:
    map<int, char> letters;
public:
    Constraint() = default;

    /**
     * @brief Build from a pattern where '?' is a free position, e.g. "a??le".
     */
    explicit Constraint(const string& pattern);

    /**
     * @brief Copy of this constraint with `letter` fixed at `index`.
     */
    Constraint with(int index, char letter) const;

    /**
     * @brief Whether `word` agrees with every fixed letter.
     *
     * A word too short to hold a fixed index does not match.
     */
    bool matches(const string& word) const;

    optional<char> get(int index) const;
    int num_set() const;
};

/**
 * @brief Immutable multiset of letters still available for placement.
 */
class LetterPool {

private:
    map<char, int> counts;
public:
    LetterPool() = default;
    explicit LetterPool(const string& letters);

    int count(char letter) const;
    bool contains(char letter) const;

    /**
     * @brief Copy of this pool with one `letter` removed.
     * @throws std::invalid_argument if the pool holds no `letter`.
     */
    LetterPool without(char letter) const;

    int size() const;
    bool empty() const;
    bool operator==(const LetterPool &rhs) const;
};

/**
 * @brief An incomplete word of the grid and the cells it covers.
 */
struct WordSlot {
    Constraint constraint;
    vector<Coord> cells;
};

/**
 * @brief Partially filled Waffle grid.
 */
class ConstraintBoard {

private:
    vector<Constraint> rows;
    vector<Constraint> cols;
    LetterPool unused;
    int side_length = 0;
    void check_cell(int row, int col) const;
public:
    ConstraintBoard() = default;

    /**
     * @brief Parse a grid description.
     *
     * Every alphanumeric character adds its lowercase form to the letter pool;
     * uppercase letters are also fixed at their cell. Other characters mark
     * unknown cells.
     *
     * @param lines Square grid rows with an odd side length.
     * @throws std::invalid_argument on a malformed grid or an uppercase letter
     *         on a block cell.
     */
    explicit ConstraintBoard(const vector<string>& lines);

    int get_side_length() const;

    /**
     * @brief Whether the cell lies on no word (odd row and odd column).
     */
    bool is_block(int row, int col) const;

    /**
     * @brief Letter placed at the cell, if any.
     * @throws OutOfBounds if the cell is outside the grid.
     */
    optional<char> get(int row, int col) const;

    /**
     * @brief Place `letter` at the cell.
     *
     * @return An unchanged copy if the same letter is already there, a new
     *         board with the letter consumed from the pool, or std::nullopt
     *         if the pool has no such letter left.
     * @throws std::invalid_argument if the cell is a block or already holds
     *         a different letter.
     */
    optional<ConstraintBoard> with(int row, int col, char letter) const;

    /**
     * @brief Every row and column word that still has free cells, rows first.
     */
    vector<WordSlot> get_open_words() const;

    const LetterPool& get_unused() const;

    /**
     * @brief Grid rows with blocks and free cells shown as spaces.
     */
    vector<string> get_lines() const;
    string to_string() const;
};

#endif // __CONSTRAINTS_HPP___
