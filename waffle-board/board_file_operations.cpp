#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "board.hpp"
#include "board_file_operations.hpp"

std::vector<std::string> read_lines_from_file(const std::string& filename) {
    std::ifstream infile(filename);
    if (!infile.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(infile, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    if (infile.bad()) {
        throw std::runtime_error("Could not read file: " + filename);
    }
    return lines;
}

Board read_board_from_file(const std::string& filename) {
    std::vector<std::string> lines = read_lines_from_file(filename);
    if (lines.empty()) {
        throw std::invalid_argument("Expected at least one line in " + filename);
    }
    try {
        return Board(lines);
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument(filename + ": " + e.what());
    }
}

void write_board_to_file(const Board& board, const std::string& filename) {
    std::ofstream outfile(filename);
    if (!outfile.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + filename);
    }
    for (const auto &line : board.get_lines()) {
        outfile << line << "\n";
    }
    if (!outfile) {
        throw std::runtime_error("Could not write file: " + filename);
    }
}
