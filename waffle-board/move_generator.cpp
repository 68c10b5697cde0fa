#include <algorithm>
#include <vector>

#include "board.hpp"
#include "move_generator.hpp"

using namespace std;

vector<Swap> get_candidate_swaps(const Board &current, const Board &target) {
    vector<Coord> differences = current.diff(target);
    if (differences.empty()) {
        return {};
    }
    if (differences.size() == 1) {
        throw UnreachableBoard("Only " + differences[0].to_string()
                               + " differs from the target; nothing to swap it with");
    }

    vector<Swap> swaps;
    swaps.reserve(differences.size() * (differences.size() - 1) / 2);
    for (size_t i = 0; i < differences.size(); ++i) {
        for (size_t j = i + 1; j < differences.size(); ++j) {
            swaps.emplace_back(differences[i], differences[j]);
        }
    }
    sort(swaps.begin(), swaps.end());
    swaps.erase(unique(swaps.begin(), swaps.end()), swaps.end());
    return swaps;
}
