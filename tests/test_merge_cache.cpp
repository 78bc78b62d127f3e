#include <cassert>
#include <cstdio>
#include <numeric>
#include <stdexcept>
#include <thread>
#include <vector>
#include "core/player_state.h"
#include "data/items.h"

std::vector<int> row_major_order(int n) {
    std::vector<int> order(n);
    std::iota(order.begin(), order.end(), 1);
    return order;
}

void test_starts_stale_and_caches() {
    std::printf("[TEST] Cache starts stale and serves repeats...\n");
    PlayerState state(1);
    state.bind_puzzle(5, 5, row_major_order(25));
    assert(state.merge_cache().is_stale());

    assert(state.merges() == 0);
    assert(!state.merge_cache().is_stale());
    assert(state.merge_cache().recomputations() == 1);

    assert(state.merges() == 0);
    assert(state.merge_cache().recomputations() == 1);
    std::printf(" -> PASS\n");
}

void test_collect_and_remove_invalidate() {
    std::printf("[TEST] collect/remove mark the cache stale...\n");
    PlayerState state(1);
    state.bind_puzzle(5, 5, row_major_order(25));

    const Item bundle = create_item("3 Puzzle Pieces", 1);
    assert(state.collect(bundle));
    assert(state.merge_cache().is_stale());
    assert(state.pieces() == 3);
    assert(state.merges() == 2);  // 1, 2, 3 in a row

    // Piece 7 sits below piece 2.
    assert(state.collect_piece(7));
    assert(state.pieces() == 4);
    assert(state.merges() == 3);

    assert(state.remove(bundle));
    assert(state.pieces() == 1);
    assert(state.merges() == 0);
    assert(state.merge_cache().recomputations() == 3);
    std::printf(" -> PASS\n");
}

void test_foreign_and_filler_items() {
    std::printf("[TEST] Foreign and filler items change nothing but staleness...\n");
    PlayerState state(1);
    state.bind_puzzle(5, 5, row_major_order(25));
    assert(state.merges() == 0);

    assert(!state.collect(create_item("5 Puzzle Pieces", 2)));
    assert(state.merge_cache().is_stale());
    assert(state.merges() == 0);

    assert(!state.collect(create_item(FILLER_ITEM, 1)));
    assert(!state.collect(create_item(encouragements().front(), 1)));
    assert(state.pieces() == 0);
    assert(!state.remove(create_item("1 Puzzle Piece", 1)));
    assert(state.merges() == 0);
    std::printf(" -> PASS\n");
}

void test_unbound_state() {
    std::printf("[TEST] Unbound state reports zero merges...\n");
    PlayerState state(4);
    state.collect(create_item("2 Puzzle Pieces", 4));
    assert(state.pieces() == 2);
    assert(state.merges() == 0);
    std::printf(" -> PASS\n");
}

void test_single_pieces_need_a_grid() {
    std::printf("[TEST] Single pieces are checked against the bound grid...\n");
    PlayerState state(1);
    bool threw = false;
    try {
        state.collect_piece(30);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    assert(state.pieces() == 0);

    state.bind_puzzle(6, 5, row_major_order(30));
    assert(state.collect_piece(30));
    assert(state.merges() == 0);

    // Shrinking the grid under a held piece is refused and changes nothing.
    threw = false;
    try {
        state.bind_puzzle(5, 5, row_major_order(25));
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
    assert(state.width() == 6);

    threw = false;
    try {
        state.collect_piece(31);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    // Rule evaluation on the surviving state stays well-formed.
    assert(state.merges() == 0);
    assert(state.pieces() == 1);
    std::printf(" -> PASS\n");
}

void test_mixed_bundles_and_single_pieces() {
    std::printf("[TEST] Pieces counter counts distinct held pieces...\n");
    PlayerState state(1);
    state.bind_puzzle(5, 5, row_major_order(25));
    state.collect(create_item("3 Puzzle Pieces", 1));

    // Piece 1 already arrived with the bundle.
    assert(state.collect_piece(1));
    assert(state.pieces() == 3);
    assert(state.held_piece_set().size() == 3);
    assert(state.merges() == 2);

    // Piece 9 is new: (1, 3) touches nothing held.
    assert(state.collect_piece(9));
    assert(state.pieces() == 4);
    assert(state.merges() == 2);

    // Losing the bundle leaves the explicit pieces counted.
    assert(state.remove(create_item("3 Puzzle Pieces", 1)));
    assert(state.pieces() == 2);
    assert(state.merges() == 0);

    // A later bundle that covers piece 9 does not count it twice.
    state.collect(create_item("10 Puzzle Pieces", 1));
    assert(state.pieces() == 10);
    assert(state.merges() == 9);
    std::printf(" -> PASS\n");
}

void test_concurrent_readers() {
    std::printf("[TEST] Concurrent readers recompute once...\n");
    PlayerState state(1);
    state.bind_puzzle(5, 5, row_major_order(25));
    state.collect(create_item("10 Puzzle Pieces", 1));

    std::vector<int> results(8, -1);
    std::vector<std::thread> readers;
    for (int t = 0; t < 8; ++t) {
        readers.emplace_back([&state, &results, t]() { results[t] = state.merges(); });
    }
    for (auto& th : readers) th.join();

    for (int r : results) assert(r == 9);
    assert(state.merge_cache().recomputations() == 1);
    std::printf(" -> PASS\n");
}

int main() {
    std::printf("=== Merge Cache Tests ===\n");
    test_starts_stale_and_caches();
    test_collect_and_remove_invalidate();
    test_foreign_and_filler_items();
    test_unbound_state();
    test_single_pieces_need_a_grid();
    test_mixed_bundles_and_single_pieces();
    test_concurrent_readers();
    std::printf("All tests passed.\n");
    return 0;
}
