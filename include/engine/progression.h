#pragma once
#include <vector>
#include "engine/planner.h"
#include "utils/random.h"

/**
 * @brief Merge progression of one committed piece order.
 *
 * possible_merges[k]: merges counted for logic after k pieces are collected,
 * with the out-of-logic slack subtracted outside the last NO_SLACK_TAIL pieces.
 * actual_possible_merges[k]: the same without slack.
 * pieces_needed_per_merge[m]: smallest k with possible_merges[k] >= m.
 */
struct ProgressionTable {
    std::vector<int> possible_merges;
    std::vector<int> actual_possible_merges;
    std::vector<int> pieces_needed_per_merge;

    int npieces() const { return static_cast<int>(possible_merges.size()) - 1; }
};

// Replays plan.piece_order() through a fresh PuzzleBoard.
ProgressionTable build_progression_table(int nx, int ny, const PiecePlan& plan, int out_of_logic);

// Monotone inverse of possible_merges for m = 0..npieces-1.
// Throws InfeasibleConfigError when some m is never reached.
std::vector<int> compute_pieces_needed_per_merge(const std::vector<int>& possible_merges, int npieces);

// Milestones 1..npieces-2 split between item-bearing and filler checks.
struct LocationPlan {
    std::vector<int> item_locations;
    std::vector<int> filler_locations;
    int min_pieces_per_location = 1;
    int repair_swaps = 0;
};

int count_item_locations(int npieces, int percentage_of_merges_that_are_checks, int maximum_number_of_checks);

// ceil(itempool * (100 + extra) / 100)
int count_pieces_left(int itempool_size, int percentage_of_extra_pieces);

// Spreads number_of_locations item milestones as evenly as possible among the
// npieces - 2 milestones; the rest become filler milestones. Both sorted.
void spread_locations(int npieces, int number_of_locations, std::vector<int>& item_locations, std::vector<int>& filler_locations);

// Swaps item and filler milestones until every milestone i is followed by a
// reachable milestone i + 1 given the pieces handed out so far.
// Returns the number of swaps; throws InfeasibleConfigError when no swap is
// possible or REPAIR_MAX_ITERATIONS is exceeded.
int repair_locations(const ProgressionTable& table, int precollected, int min_pieces_per_location,
                     std::vector<int>& item_locations, std::vector<int>& filler_locations, RandomSource& rng);

// Full milestone assignment: counts, spread and repair.
LocationPlan plan_locations(const ProgressionTable& table, const PiecePlan& plan, int number_of_locations,
                            int percentage_of_extra_pieces, RandomSource& rng);
