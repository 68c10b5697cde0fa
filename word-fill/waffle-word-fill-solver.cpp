#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "board.hpp"
#include "board_file_operations.hpp"
#include "constraints.hpp"
#include "logging.hpp"
#include "waffle-word-fill-solver.hpp"

std::optional<ConstraintBoard> place_word(const ConstraintBoard &board, const std::string &word,
                                          const std::vector<Coord> &cells) {
    if (word.size() != cells.size()) {
        throw std::invalid_argument("Word '" + word + "' does not fit " + std::to_string(cells.size()) + " cells");
    }
    ConstraintBoard current = board;
    for (size_t cursor = 0; cursor < cells.size(); ++cursor) {
        auto next = current.with(cells[cursor].row, cells[cursor].col, word[cursor]);
        if (!next) return std::nullopt;
        current = std::move(*next);
    }
    return current;
}

std::vector<ConstraintBoard> WordFillSolver(const ConstraintBoard &board, const std::vector<std::string> &wordlist,
                                            int* visited_nodes) {
    auto logger = waffle_logger();
    std::vector<ConstraintBoard> solutions;
    std::vector<ConstraintBoard> stack;
    stack.push_back(board);

    while (!stack.empty()) {
        ConstraintBoard current = std::move(stack.back());
        stack.pop_back();
        if (visited_nodes) {
            (*visited_nodes)++;
        }

        std::vector<WordSlot> words = current.get_open_words();
        if (words.empty()) {
            solutions.push_back(current);
            logger->debug("fill #{} found", solutions.size());
            continue;
        }

        const WordSlot &slot = words.front();
        std::vector<ConstraintBoard> children;
        for (const auto &word : wordlist) {
            if (word.size() != slot.cells.size() || !slot.constraint.matches(word)) continue;
            auto next = place_word(current, word, slot.cells);
            if (next) children.push_back(std::move(*next));
        }
        // Reversed so the first matching word is explored first
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.push_back(std::move(*it));
        }
    }
    logger->info("{} complete fills", solutions.size());
    return solutions;
}

std::vector<std::string> read_wordlist_from_file(const std::string &filename) {
    std::vector<std::string> words;
    for (const auto &line : read_lines_from_file(filename)) {
        auto begin = std::find_if_not(line.begin(), line.end(),
                                      [](unsigned char c) { return std::isspace(c); });
        auto end = std::find_if_not(line.rbegin(), line.rend(),
                                    [](unsigned char c) { return std::isspace(c); }).base();
        if (begin >= end) continue;
        std::string word(begin, end);
        std::transform(word.begin(), word.end(), word.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        words.push_back(word);
    }
    return words;
}
