#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "board.hpp"

using namespace std;

bool Coord::operator==(const Coord &rhs) const {
    return row == rhs.row && col == rhs.col;
}

bool Coord::operator!=(const Coord &rhs) const {
    return !(*this == rhs);
}

bool Coord::operator<(const Coord &rhs) const {
    if (row != rhs.row) return row < rhs.row;
    return col < rhs.col;
}

string Coord::to_string() const {
    return "(" + std::to_string(row) + "," + std::to_string(col) + ")";
}

Swap::Swap(const Coord &a, const Coord &b)
    : first(min(a, b)), second(max(a, b))
{
}

const Coord& Swap::get_first() const {
    return first;
}

const Coord& Swap::get_second() const {
    return second;
}

bool Swap::operator==(const Swap &rhs) const {
    return first == rhs.first && second == rhs.second;
}

bool Swap::operator!=(const Swap &rhs) const {
    return !(*this == rhs);
}

bool Swap::operator<(const Swap &rhs) const {
    if (first != rhs.first) return first < rhs.first;
    return second < rhs.second;
}

void Board::init(const vector<string>& lines) {
    if (lines.empty()) {
        throw invalid_argument("Board must have at least one row");
    }
    size_t width = lines[0].size();
    if (width == 0) {
        throw invalid_argument("Board rows cannot be empty");
    }
    for (size_t i = 1; i < lines.size(); ++i) {
        if (lines[i].size() != width) {
            throw invalid_argument("Board rows must all have the same length (row " + std::to_string(i)
                                   + " has " + std::to_string(lines[i].size()) + ", expected "
                                   + std::to_string(width) + ")");
        }
    }
    this->rows = static_cast<int>(lines.size());
    this->cols = static_cast<int>(width);
    this->cells.clear();
    this->cells.reserve(lines.size() * width);
    for (const auto &line : lines) {
        cells.insert(cells.end(), line.begin(), line.end());
    }
}

Board::Board(const vector<string>& lines) {
    init(lines);
}

size_t Board::index_of(const Coord &coord) const {
    if (coord.row < 0 || coord.row >= rows || coord.col < 0 || coord.col >= cols) {
        throw OutOfBounds("Coordinate " + coord.to_string() + " is outside a "
                          + std::to_string(rows) + "x" + std::to_string(cols) + " board");
    }
    return static_cast<size_t>(coord.row) * cols + coord.col;
}

void Board::check_dimensions(const Board &other) const {
    if (rows != other.rows || cols != other.cols) {
        throw DimensionMismatch("Size mismatch: " + std::to_string(rows) + "x" + std::to_string(cols)
                                + " vs " + std::to_string(other.rows) + "x" + std::to_string(other.cols));
    }
}

size_t Board::hash() const {
    size_t h = 1469598103934665603ULL; // FNV offset
    h ^= static_cast<size_t>(rows);
    h *= 1099511628211ULL;
    h ^= static_cast<size_t>(cols);
    h *= 1099511628211ULL;
    for (char c : cells) {
        h ^= static_cast<size_t>(static_cast<unsigned char>(c));
        h *= 1099511628211ULL; // FNV prime
    }
    return h;
}

int Board::get_rows() const {
    return rows;
}

int Board::get_cols() const {
    return cols;
}

char Board::get(const Coord &coord) const {
    return cells[index_of(coord)];
}

vector<Coord> Board::diff(const Board &other) const {
    check_dimensions(other);
    vector<Coord> differences;
    for (int row = 0; row < rows; ++row) {
        for (int col = 0; col < cols; ++col) {
            size_t i = static_cast<size_t>(row) * cols + col;
            if (cells[i] != other.cells[i]) {
                differences.push_back({row, col});
            }
        }
    }
    return differences;
}

int Board::distance(const Board &other) const {
    return static_cast<int>(diff(other).size());
}

Board Board::apply(const Swap &swap) const {
    size_t a = index_of(swap.get_first());
    size_t b = index_of(swap.get_second());
    Board next = *this;
    std::swap(next.cells[a], next.cells[b]);
    return next;
}

vector<string> Board::get_lines() const {
    vector<string> lines;
    for (int row = 0; row < rows; ++row) {
        auto begin = cells.begin() + static_cast<size_t>(row) * cols;
        lines.emplace_back(begin, begin + cols);
    }
    return lines;
}

string Board::to_string() const {
    string out;
    for (int row = 0; row < rows; ++row) {
        if (row) out += '\n';
        out.append(cells.begin() + static_cast<size_t>(row) * cols,
                   cells.begin() + static_cast<size_t>(row + 1) * cols);
    }
    return out;
}

bool Board::operator==(const Board &rhs) const {
    if (rows != rhs.rows) return false;
    if (cols != rhs.cols) return false;
    return cells == rhs.cells;
}

bool Board::operator!=(const Board &rhs) const {
    return !(*this == rhs);
}

bool Board::operator<(const Board &rhs) const {
    if (rows != rhs.rows) return rows < rhs.rows;
    if (cols != rhs.cols) return cols < rhs.cols;
    return cells < rhs.cells;
}
