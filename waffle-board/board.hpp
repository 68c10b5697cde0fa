/**
 * @file board.hpp
 * @brief Waffle board representation (character grid, coordinates and swaps).
 *
 * This header declares the Board class used across solvers and tools.
 */

#ifndef __BOARD_HPP___
#define __BOARD_HPP___

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;

/**
 * @brief Raised when two boards of different dimensions are compared.
 */
class DimensionMismatch : public invalid_argument {
public:
    using invalid_argument::invalid_argument;
};

/**
 * @brief Raised when a coordinate falls outside the board.
 */
class OutOfBounds : public out_of_range {
public:
    using out_of_range::out_of_range;
};

/**
 * @brief A (row, col) cell position, ordered lexicographically.
 */
struct Coord {
    int row = 0;
    int col = 0;

    bool operator==(const Coord &rhs) const;
    bool operator!=(const Coord &rhs) const;
    bool operator<(const Coord &rhs) const;

    /**
     * @brief Format as `(row,col)`.
     */
    string to_string() const;
};

/**
 * @brief An unordered pair of coordinates.
 *
 * The pair is stored as (min, max) so that swapping (a, b) and (b, a)
 * compare and hash equal.
 */
class Swap {

private:
    Coord first;
    Coord second;
public:
    Swap() = default;
    Swap(const Coord &a, const Coord &b);

    const Coord& get_first() const;
    const Coord& get_second() const;

    bool operator==(const Swap &rhs) const;
    bool operator!=(const Swap &rhs) const;
    bool operator<(const Swap &rhs) const;
};

/**
 * @brief Immutable rows x cols grid of single characters.
 *
 * Every operation returns a new value; the dimensions are fixed at
 * construction.
 */
class Board {

private:
    vector<char> cells;
    int rows = 0;
    int cols = 0;
    void init(const vector<string>& lines);
    size_t index_of(const Coord &coord) const;
    void check_dimensions(const Board &other) const;
public:
    Board() = default;

    /**
     * @brief Construct a Board from its rows.
     *
     * @param lines One string per row, all of the same non-zero length.
     * @throws std::invalid_argument if there are no rows, a row is empty or
     *         the rows have different lengths.
     */
    explicit Board(const vector<string>& lines);
    ~Board() = default;

    // Rule of five
    Board(const Board& other) = default;
    Board& operator=(const Board& other) = default;
    Board(Board&& other) = default;
    Board& operator=(Board&& other) = default;

    /**
     * @brief Compute a stable hash of the board contents.
     *
     * The hash is suitable for use in unordered containers.
     * @return A size_t hash value.
     */
    size_t hash() const;

    int get_rows() const;
    int get_cols() const;

    /**
     * @brief Character stored at the given cell.
     * @throws OutOfBounds if the coordinate is outside the board.
     */
    char get(const Coord &coord) const;

    /**
     * @brief Coordinates at which this board and `other` disagree, in row-major order.
     * @throws DimensionMismatch if the boards have different dimensions.
     */
    vector<Coord> diff(const Board &other) const;

    /**
     * @brief Hamming distance to `other` (number of differing cells).
     * @throws DimensionMismatch if the boards have different dimensions.
     */
    int distance(const Board &other) const;

    /**
     * @brief Return a copy of this board with the two cells of `swap` exchanged.
     * @throws OutOfBounds if either coordinate is outside the board.
     */
    Board apply(const Swap &swap) const;

    vector<string> get_lines() const;

    /**
     * @brief Rows joined with '\n' (no trailing newline).
     */
    string to_string() const;

    bool operator==(const Board &rhs) const;
    bool operator!=(const Board &rhs) const;

    /**
     * @brief Strict weak ordering used for ordered containers (std::set).
     */
    bool operator<(const Board &rhs) const;
};

/**
 * @brief Hash functor so Board can key unordered containers.
 */
struct BoardHash {
    size_t operator()(const Board &board) const { return board.hash(); }
};

#endif // __BOARD_HPP___
