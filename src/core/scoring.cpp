#include "core/scoring.h"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace {

struct GroupScan {
    int pieces = 0;
    int groups = 0;
};

GroupScan scan_groups(const std::vector<int>& pieces, int width, int height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("scoring: grid dimensions must be positive");
    }
    const int cells = width * height;

    // 0: not held, 1: held, 2: held and visited
    std::vector<uint8_t> state(cells, 0);
    GroupScan scan;
    for (int p : pieces) {
        if (p < 1 || p > cells) {
            throw std::out_of_range("scoring: piece " + std::to_string(p) + " outside the grid");
        }
        if (state[p - 1] == 0) {
            state[p - 1] = 1;
            ++scan.pieces;
        }
    }

    std::vector<int> stack;
    stack.reserve(scan.pieces);
    for (int start = 0; start < cells; ++start) {
        if (state[start] != 1) continue;
        ++scan.groups;
        state[start] = 2;
        stack.push_back(start);
        while (!stack.empty()) {
            const int i = stack.back();
            stack.pop_back();
            const int x = i % width;
            const int y = i / width;
            const int nbrs[4] = {
                x > 0 ? i - 1 : -1,
                x < width - 1 ? i + 1 : -1,
                y > 0 ? i - width : -1,
                y < height - 1 ? i + width : -1,
            };
            for (int n : nbrs) {
                if (n >= 0 && state[n] == 1) {
                    state[n] = 2;
                    stack.push_back(n);
                }
            }
        }
    }
    return scan;
}

} // namespace

int count_groups_in(const std::vector<int>& pieces, int width, int height) {
    return scan_groups(pieces, width, height).groups;
}

int merges_in(const std::vector<int>& pieces, int width, int height) {
    const GroupScan scan = scan_groups(pieces, width, height);
    return scan.pieces - scan.groups;
}
