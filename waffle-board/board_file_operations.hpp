#ifndef __BOARD_FILE_OPERATIONS_HPP___
#define __BOARD_FILE_OPERATIONS_HPP___

#include <string>
#include <vector>

#include "board.hpp"

/**
 * @file board_file_operations.hpp
 * @brief Helpers to read/write `Board` values from plain text files.
 *
 * The file format is one board row per line, every line of equal length.
 * A trailing '\r' on a line is dropped.
 */

/**
 * @brief Read the lines of a text file, without line terminators.
 *
 * @param filename Path to the input file.
 * @throws std::runtime_error if the file cannot be opened or read.
 */
std::vector<std::string> read_lines_from_file(const std::string& filename);

/**
 * @brief Read a `Board` from a plain-text file.
 *
 * @param filename Path to the input file.
 * @throws std::runtime_error if the file cannot be opened.
 * @throws std::invalid_argument if the file is empty or its rows are ragged.
 * @return Constructed `Board` instance.
 */
Board read_board_from_file(const std::string& filename);

/**
 * @brief Write a `Board` to a plain-text file, one row per line.
 *
 * @param board Board to serialize.
 * @param filename Output file path.
 * @throws std::runtime_error if the file cannot be opened for writing.
 */
void write_board_to_file(const Board& board, const std::string& filename);

#endif // __BOARD_FILE_OPERATIONS_HPP___
