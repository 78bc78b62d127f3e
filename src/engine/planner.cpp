#include "engine/planner.h"
#include <stdexcept>

std::vector<int> PiecePlan::piece_order() const {
    std::vector<int> order;
    order.reserve(precollected.size() + itempool.size());
    order.insert(order.end(), precollected.begin(), precollected.end());
    order.insert(order.end(), itempool.begin(), itempool.end());
    return order;
}

PlannerSettings PlannerSettings::from_options(const JigsawOptions& opts) {
    PlannerSettings s;
    s.piece_order_type = opts.piece_order_type;
    s.strictness_piece_order_type = opts.strictness_piece_order_type;
    s.piece_order = opts.piece_order;
    s.strictness_piece_order = opts.strictness_piece_order;
    s.out_of_logic = opts.number_of_checks_out_of_logic;
    return s;
}

PiecePlanner::PiecePlanner(int nx, int ny, const PlannerSettings& settings, RandomSource& rng)
    : nx(nx), ny(ny), settings(settings), rng(rng), live_board(nx, ny), first_piece(true), best_result_ever(0)
{
}

PiecePlan PiecePlanner::plan() {
    return plan(build_piece_groups(nx, ny, settings.piece_order_type, settings.strictness_piece_order_type, rng));
}

PiecePlan PiecePlanner::plan(PieceGroups groups) {
    live_board = PuzzleBoard(nx, ny);
    first_piece = true;

    PiecePlan result;
    for (auto& pieces : groups) {
        best_result_ever = 0;
        while (!pieces.empty()) {
            const int p = next_piece(pieces);

            // Merges left on the board unlock the queued items: further pieces
            // must be found. Otherwise nothing gates the piece, so it is free.
            if (live_board.merges_count() > static_cast<int>(result.itempool.size()) + settings.out_of_logic) {
                result.itempool.push_back(p);
            } else {
                result.precollected.push_back(p);
            }

            live_board.add_piece(p - 1);
            first_piece = false;
        }
    }
    return result;
}

int PiecePlanner::next_piece(std::vector<int>& pieces) {
    if (settings.piece_order == PieceOrderStrategy::RandomOrder ||
        settings.strictness_piece_order / 100.0 < rng.random()) {
        const int p = pieces.front();
        pieces.erase(pieces.begin());
        return p;
    }
    if (settings.piece_order == PieceOrderStrategy::EveryPieceFits) return pick_every_piece_fits(pieces);
    return pick_least_merges(pieces);
}

int PiecePlanner::pick_every_piece_fits(std::vector<int>& pieces) {
    size_t pick = 0;
    for (size_t i = 0; i < pieces.size(); ++i) {
        if (first_piece || live_board.get_merges_from_adding_piece(pieces[i] - 1) > 0) {
            pick = i;
            break;
        }
    }
    const int p = pieces[pick];
    pieces.erase(pieces.begin() + pick);
    rng.shuffle(pieces);
    return p;
}

int PiecePlanner::pick_least_merges(std::vector<int>& pieces) {
    // Hot loop: one speculative query per remaining piece.
    size_t best_piece = 0;
    int best_result = 5;
    for (size_t i = 0; i < pieces.size(); ++i) {
        const int m = live_board.get_merges_from_adding_piece(pieces[i] - 1);
        if (first_piece || m <= best_result_ever) {
            best_piece = i;
            best_result = 0;
            break;
        }
        if (m < best_result) {
            best_piece = i;
            best_result = m;
        }
    }
    const int p = pieces[best_piece];
    best_result_ever = best_result;
    pieces.erase(pieces.begin() + best_piece);
    rng.shuffle(pieces);
    return p;
}
