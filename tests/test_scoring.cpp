#include <cassert>
#include <cstdio>
#include <numeric>
#include <stdexcept>
#include <vector>
#include "core/puzzle_board.h"
#include "core/scoring.h"
#include "utils/random.h"

void test_isolated_pieces() {
    std::printf("[TEST] 5x5 isolated pieces...\n");
    // (0,0), (1,3) and (2,4): no shared edge.
    assert(count_groups_in({1, 9, 15}, 5, 5) == 3);
    assert(merges_in({1, 9, 15}, 5, 5) == 0);
    assert(merges_in({}, 5, 5) == 0);
    std::printf(" -> PASS\n");
}

void test_vertical_neighbours() {
    std::printf("[TEST] 5x5 vertical neighbours...\n");
    // 9 and 14 sit one row apart in the same column.
    assert(count_groups_in({1, 9, 14}, 5, 5) == 2);
    assert(merges_in({1, 9, 14}, 5, 5) == 1);
    std::printf(" -> PASS\n");
}

void test_no_row_wrap() {
    std::printf("[TEST] Row ends do not connect...\n");
    // 5 ends row 0, 6 starts row 1.
    assert(merges_in({5, 6}, 5, 5) == 0);
    assert(merges_in({4, 5}, 5, 5) == 1);
    std::printf(" -> PASS\n");
}

void test_full_board_and_duplicates() {
    std::printf("[TEST] Full board and duplicate ids...\n");
    std::vector<int> all(24);
    std::iota(all.begin(), all.end(), 1);
    assert(merges_in(all, 6, 4) == 23);
    assert(count_groups_in(all, 6, 4) == 1);
    assert(merges_in({1, 1, 2, 2}, 5, 5) == 1);
    std::printf(" -> PASS\n");
}

void test_bad_ids() {
    std::printf("[TEST] Ids outside the grid throw...\n");
    bool threw = false;
    try {
        merges_in({0, 1}, 5, 5);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        merges_in({26}, 5, 5);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
    std::printf(" -> PASS\n");
}

void test_order_independent_and_matches_board() {
    std::printf("[TEST] Order independence and board replay...\n");
    const int w = 7, h = 4;
    RandomSource rng(99);
    for (int trial = 0; trial < 50; ++trial) {
        std::vector<int> pieces(w * h);
        std::iota(pieces.begin(), pieces.end(), 1);
        rng.shuffle(pieces);
        pieces.resize(1 + rng.below(w * h));

        const int expected = merges_in(pieces, w, h);
        std::vector<int> shuffled = pieces;
        rng.shuffle(shuffled);
        assert(merges_in(shuffled, w, h) == expected);

        PuzzleBoard board(w, h);
        for (int p : shuffled) board.add_piece(p - 1);
        assert(board.merges_count() == expected);
        assert(static_cast<int>(pieces.size()) - count_groups_in(pieces, w, h) == expected);
    }
    std::printf(" -> PASS\n");
}

int main() {
    std::printf("=== Reachability Counter Tests ===\n");
    test_isolated_pieces();
    test_vertical_neighbours();
    test_no_row_wrap();
    test_full_board_and_duplicates();
    test_bad_ids();
    test_order_independent_and_matches_board();
    std::printf("All tests passed.\n");
    return 0;
}
