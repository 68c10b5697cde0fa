#include <cctype>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "board.hpp"
#include "constraints.hpp"

using namespace std;

Constraint::Constraint(const string& pattern) {
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '?') continue;
        letters[static_cast<int>(i)] = pattern[i];
    }
}

Constraint Constraint::with(int index, char letter) const {
    Constraint next = *this;
    next.letters[index] = letter;
    return next;
}

bool Constraint::matches(const string& word) const {
    for (const auto &entry : letters) {
        if (entry.first >= static_cast<int>(word.size())) return false;
        if (word[entry.first] != entry.second) return false;
    }
    return true;
}

optional<char> Constraint::get(int index) const {
    auto it = letters.find(index);
    if (it == letters.end()) return nullopt;
    return it->second;
}

int Constraint::num_set() const {
    return static_cast<int>(letters.size());
}

LetterPool::LetterPool(const string& letters) {
    for (char c : letters) {
        ++counts[c];
    }
}

int LetterPool::count(char letter) const {
    auto it = counts.find(letter);
    return it == counts.end() ? 0 : it->second;
}

bool LetterPool::contains(char letter) const {
    return count(letter) > 0;
}

LetterPool LetterPool::without(char letter) const {
    auto it = counts.find(letter);
    if (it == counts.end()) {
        throw invalid_argument(string("No '") + letter + "' left in the letter pool");
    }
    LetterPool next = *this;
    if (it->second == 1) {
        next.counts.erase(letter);
    } else {
        --next.counts[letter];
    }
    return next;
}

int LetterPool::size() const {
    int total = 0;
    for (const auto &entry : counts) total += entry.second;
    return total;
}

bool LetterPool::empty() const {
    return counts.empty();
}

bool LetterPool::operator==(const LetterPool &rhs) const {
    return counts == rhs.counts;
}

ConstraintBoard::ConstraintBoard(const vector<string>& lines) {
    // Reuses the Board checks for empty and ragged grids
    Board grid(lines);
    if (grid.get_rows() != grid.get_cols()) {
        throw invalid_argument("Waffle grid must be square, got " + std::to_string(grid.get_rows()) + "x"
                               + std::to_string(grid.get_cols()));
    }
    if (grid.get_cols() % 2 == 0) {
        throw invalid_argument("Waffle grid side length must be odd, got " + std::to_string(grid.get_cols()));
    }
    side_length = grid.get_cols();
    rows.assign(side_length / 2 + 1, Constraint());
    cols.assign(side_length / 2 + 1, Constraint());

    string letters;
    for (const auto &line : lines) {
        for (char c : line) {
            if (isalnum(static_cast<unsigned char>(c))) {
                letters += static_cast<char>(tolower(static_cast<unsigned char>(c)));
            }
        }
    }
    unused = LetterPool(letters);

    for (int row = 0; row < side_length; ++row) {
        for (int col = 0; col < side_length; ++col) {
            char c = lines[row][col];
            if (!isupper(static_cast<unsigned char>(c))) continue;
            if (is_block(row, col)) {
                throw invalid_argument("Fixed letter '" + string(1, c) + "' on block cell "
                                       + Coord{row, col}.to_string());
            }
            // The letter was just added to the pool, so this always succeeds
            *this = *with(row, col, static_cast<char>(tolower(static_cast<unsigned char>(c))));
        }
    }
}

int ConstraintBoard::get_side_length() const {
    return side_length;
}

void ConstraintBoard::check_cell(int row, int col) const {
    if (row < 0 || row >= side_length || col < 0 || col >= side_length) {
        throw OutOfBounds("Cell " + Coord{row, col}.to_string() + " is outside a "
                          + std::to_string(side_length) + "x" + std::to_string(side_length) + " grid");
    }
}

bool ConstraintBoard::is_block(int row, int col) const {
    return row % 2 == 1 && col % 2 == 1;
}

optional<char> ConstraintBoard::get(int row, int col) const {
    check_cell(row, col);
    if (row % 2 == 0) return rows[row / 2].get(col);
    if (col % 2 == 0) return cols[col / 2].get(row);
    return nullopt;
}

optional<ConstraintBoard> ConstraintBoard::with(int row, int col, char letter) const {
    if (is_block(row, col)) {
        throw invalid_argument("Cannot place a letter on block cell " + Coord{row, col}.to_string());
    }
    optional<char> current = get(row, col);
    if (current) {
        if (*current == letter) return *this;
        throw invalid_argument("Cannot set " + Coord{row, col}.to_string() + " to '" + string(1, letter)
                               + "': already set to '" + string(1, *current) + "'");
    }
    if (!unused.contains(letter)) {
        return nullopt;
    }

    ConstraintBoard next = *this;
    next.unused = unused.without(letter);
    if (row % 2 == 0) {
        next.rows[row / 2] = rows[row / 2].with(col, letter);
    }
    if (col % 2 == 0) {
        next.cols[col / 2] = cols[col / 2].with(row, letter);
    }
    return next;
}

vector<WordSlot> ConstraintBoard::get_open_words() const {
    vector<WordSlot> words;
    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].num_set() == side_length) continue;
        WordSlot slot{rows[i], {}};
        for (int col = 0; col < side_length; ++col) {
            slot.cells.push_back({static_cast<int>(i) * 2, col});
        }
        words.push_back(slot);
    }
    for (size_t i = 0; i < cols.size(); ++i) {
        if (cols[i].num_set() == side_length) continue;
        WordSlot slot{cols[i], {}};
        for (int row = 0; row < side_length; ++row) {
            slot.cells.push_back({row, static_cast<int>(i) * 2});
        }
        words.push_back(slot);
    }
    return words;
}

const LetterPool& ConstraintBoard::get_unused() const {
    return unused;
}

vector<string> ConstraintBoard::get_lines() const {
    vector<string> lines;
    for (int row = 0; row < side_length; ++row) {
        string line;
        for (int col = 0; col < side_length; ++col) {
            optional<char> c = get(row, col);
            line += c ? *c : ' ';
        }
        lines.push_back(line);
    }
    return lines;
}

string ConstraintBoard::to_string() const {
    string out;
    for (const auto &line : get_lines()) {
        if (!out.empty()) out += '\n';
        out += line;
    }
    return out;
}
