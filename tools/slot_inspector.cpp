#include <algorithm>
#include <cstdio>
#include <exception>
#include <string>
#include <vector>

#include "core/puzzle_board.h"
#include "data/db_manager.h"
#include "engine/progression.h"
#include "utils/globals.h"

// Cross-checks one stored slot payload against a fresh replay of its piece order.
// Usage: slot_inspector <db> <seed_name> [player]   (no player: every player of the seed)

namespace {

bool inspect(const SlotData& data) {
    const int n = data.nx * data.ny;
    std::printf("--- Player %d | %dx%d | image %d | orientation %.3f | version %s\n",
                data.player, data.nx, data.ny, data.which_image, data.orientation, data.ap_world_version.c_str());

    std::vector<int> sorted = data.piece_order;
    std::sort(sorted.begin(), sorted.end());
    bool permutation = static_cast<int>(sorted.size()) == n;
    for (int i = 0; permutation && i < n; ++i) permutation = sorted[i] == i + 1;
    std::printf("Piece order is a permutation of 1..%d: %s\n", n, permutation ? "YES" : "NO");
    if (!permutation) return false;

    PuzzleBoard board(data.nx, data.ny);
    std::vector<int> replay{0};
    for (int piece : data.piece_order) {
        board.add_piece(piece - 1);
        replay.push_back(board.merges_count());
    }
    const bool replay_ok = replay == data.actual_possible_merges;
    std::printf("Replay matches actual_possible_merges: %s (final %d)\n", replay_ok ? "YES" : "NO", replay.back());

    bool slack_ok = data.possible_merges.size() == replay.size();
    for (size_t k = 0; slack_ok && k < replay.size(); ++k) slack_ok = data.possible_merges[k] <= replay[k];
    std::printf("possible_merges bounded by replay: %s\n", slack_ok ? "YES" : "NO");

    try {
        const std::vector<int> needed = compute_pieces_needed_per_merge(data.possible_merges, n);
        if (n >= 2) {
            std::printf("Pieces needed for merge 1 / %d / %d: %d / %d / %d\n",
                        n / 2, n - 1, needed[1], needed[n / 2], needed[n - 1]);
        }
    } catch (const std::exception& e) {
        std::printf("pieces_needed_per_merge: %s\n", e.what());
        return false;
    }

    print_board(data.player, data.nx, data.ny, data.piece_order, 0);
    return replay_ok && slack_ok;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::printf("Usage: %s <db> <seed_name> [player]\n", argv[0]);
        return 1;
    }
    if (!init_db(argv[1])) return 1;

    std::vector<SlotData> rows;
    try {
        if (argc >= 4) {
            if (auto row = load_slot_data(argv[2], std::stoi(argv[3]))) rows.push_back(*row);
        } else {
            rows = load_all_slot_data(argv[2]);
        }
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[DB] %s\n", e.what());
        close_db();
        return 1;
    }
    close_db();

    if (rows.empty()) {
        std::printf("No slot data for seed '%s'.\n", argv[2]);
        return 1;
    }

    int bad = 0;
    for (const SlotData& data : rows) {
        if (data.nx <= 0 || data.ny <= 0 || !inspect(data)) ++bad;
    }
    std::printf("\nInspected %zu players, %d inconsistent.\n", rows.size(), bad);
    return bad == 0 ? 0 : 1;
}
