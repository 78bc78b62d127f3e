#ifndef JIGSAW_PLANNER_H
#define JIGSAW_PLANNER_H

#include <vector>
#include "core/puzzle_board.h"
#include "engine/piece_groups.h"
#include "utils/options.h"
#include "utils/random.h"

// Planner output. precollected ++ itempool is a permutation of 1..nx*ny and is
// the order in which the player receives pieces.
struct PiecePlan {
    std::vector<int> precollected;
    std::vector<int> itempool;

    std::vector<int> piece_order() const;
};

struct PlannerSettings {
    PieceTypeOrder piece_order_type = PieceTypeOrder::RandomOrder;
    int strictness_piece_order_type = 100;
    PieceOrderStrategy piece_order = PieceOrderStrategy::RandomOrder;
    int strictness_piece_order = 100;
    int out_of_logic = 0;

    static PlannerSettings from_options(const JigsawOptions& opts);
};

/**
 * @brief Decides the order pieces become available and which of them are given
 * at game start.
 *
 * Walks the priority groups, picks each next piece with the selected strategy
 * (speculative merge queries against a live PuzzleBoard), then files it under
 * itempool while the merges already on the board outnumber the queued items
 * plus the out-of-logic slack, and under precollected otherwise.
 */
class PiecePlanner {
public:
    PiecePlanner(int nx, int ny, const PlannerSettings& settings, RandomSource& rng);

    PiecePlan plan();
    PiecePlan plan(PieceGroups groups);

    // Board state after the last plan() call.
    const PuzzleBoard& board() const { return live_board; }

private:
    int next_piece(std::vector<int>& pieces);
    int pick_every_piece_fits(std::vector<int>& pieces);
    int pick_least_merges(std::vector<int>& pieces);

    int nx;
    int ny;
    PlannerSettings settings;
    RandomSource& rng;
    PuzzleBoard live_board;
    bool first_piece;
    int best_result_ever;
};

#endif
