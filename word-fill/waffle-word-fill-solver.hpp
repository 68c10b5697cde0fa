#ifndef __WAFFLE_WORD_FILL_SOLVER_HPP___
#define __WAFFLE_WORD_FILL_SOLVER_HPP___

#include <optional>
#include <string>
#include <vector>

#include "board.hpp"
#include "constraints.hpp"

/**
 * @file waffle-word-fill-solver.hpp
 * @brief Fill a Waffle grid with words from a wordlist.
 */

/**
 * @brief Write `word` into `cells`, one letter at a time.
 *
 * @return The filled board, or std::nullopt if some letter is no longer in
 *         the pool.
 * @throws std::invalid_argument if `word` and `cells` differ in length or a
 *         letter conflicts with one already placed.
 */
std::optional<ConstraintBoard> place_word(const ConstraintBoard &board, const std::string &word,
                                          const std::vector<Coord> &cells);

/**
 * @brief Enumerate every complete fill of `board` using words from `wordlist`.
 *
 * Depth-first: each step takes the first open word and tries every matching
 * word of the right length, in wordlist order.
 *
 * @param board Grid to fill.
 * @param wordlist Candidate words, lowercase like the letter pool.
 * @param visited_nodes Optional out-parameter to receive number of visited boards.
 * @return Complete boards in discovery order.
 */
std::vector<ConstraintBoard> WordFillSolver(const ConstraintBoard &board, const std::vector<std::string> &wordlist,
                                            int* visited_nodes = nullptr);

/**
 * @brief Load a wordlist: one word per line, trimmed and lowercased, blank lines skipped.
 * @throws std::runtime_error if the file cannot be opened.
 */
std::vector<std::string> read_wordlist_from_file(const std::string &filename);

#endif // __WAFFLE_WORD_FILL_SOLVER_HPP___
