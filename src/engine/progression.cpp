#include "engine/progression.h"
#include "core/puzzle_board.h"
#include "utils/config.h"
#include "utils/errors.h"
#include <algorithm>
#include <stdexcept>
#include <string>

ProgressionTable build_progression_table(int nx, int ny, const PiecePlan& plan, int out_of_logic) {
    const int npieces = nx * ny;
    const std::vector<int> order = plan.piece_order();
    if (static_cast<int>(order.size()) != npieces) {
        throw std::invalid_argument("build_progression_table: piece order does not cover the grid");
    }

    ProgressionTable table;
    table.possible_merges.reserve(npieces + 1);
    table.actual_possible_merges.reserve(npieces + 1);
    table.possible_merges.push_back(-out_of_logic);
    table.actual_possible_merges.push_back(0);

    // Fresh board: the planner's board stays its own.
    PuzzleBoard board(nx, ny);
    for (int k = 1; k <= npieces; ++k) {
        board.add_piece(order[k - 1] - 1);
        const int merges = board.merges_count();
        const int remaining = npieces - k + 1;
        table.possible_merges.push_back(remaining < JigsawConfig::NO_SLACK_TAIL ? merges : merges - out_of_logic);
        table.actual_possible_merges.push_back(merges);
    }

    table.pieces_needed_per_merge = compute_pieces_needed_per_merge(table.possible_merges, npieces);
    return table;
}

std::vector<int> compute_pieces_needed_per_merge(const std::vector<int>& possible_merges, int npieces) {
    std::vector<int> needed;
    needed.reserve(std::max(npieces, 1));
    needed.push_back(0);

    // First index reaching m never moves backwards as m grows.
    size_t k = 0;
    for (int m = 1; m < npieces; ++m) {
        while (k < possible_merges.size() && possible_merges[k] < m) ++k;
        if (k == possible_merges.size()) {
            throw InfeasibleConfigError("no piece count reaches " + std::to_string(m) + " merges");
        }
        needed.push_back(static_cast<int>(k));
    }
    return needed;
}

int count_item_locations(int npieces, int percentage_of_merges_that_are_checks, int maximum_number_of_checks) {
    const int milestones = std::max(0, npieces - 2);
    return std::max(0, std::min(percentage_of_merges_that_are_checks * milestones / 100, maximum_number_of_checks));
}

int count_pieces_left(int itempool_size, int percentage_of_extra_pieces) {
    return (itempool_size * (100 + percentage_of_extra_pieces) + 99) / 100;
}

void spread_locations(int npieces, int number_of_locations, std::vector<int>& item_locations, std::vector<int>& filler_locations) {
    item_locations.clear();
    filler_locations.clear();

    const int max_score = npieces - 1;  // victory milestone, not spread
    int items = number_of_locations;
    int locs = max_score - 1;
    if (items > std::max(locs, 0)) {
        throw InfeasibleConfigError(std::to_string(items) + " checks requested for " + std::to_string(std::max(locs, 0)) + " milestones");
    }

    int i = 1;
    while (i < max_score && locs > 0) {
        int in_a_row = locs;
        int not_in_a_row = 0;
        if (locs > items) {
            in_a_row = (locs - 1) / (locs - items);
            not_in_a_row = std::max(1, (locs - items) / (items + 1));
        }
        for (int j = 0; j < in_a_row; ++j) item_locations.push_back(i + j);
        for (int j = 0; j < not_in_a_row; ++j) filler_locations.push_back(i + in_a_row + j);
        i += in_a_row + not_in_a_row;
        locs -= in_a_row + not_in_a_row;
        items -= in_a_row;
    }
}

int repair_locations(const ProgressionTable& table, int precollected, int min_pieces_per_location,
                     std::vector<int>& item_locations, std::vector<int>& filler_locations, RandomSource& rng) {
    const int npieces = table.npieces();
    int swaps = 0;

    bool do_again = true;
    while (do_again) {
        do_again = false;
        int num_pieces = precollected;

        for (int i = 1; i < npieces - 1; ++i) {
            if (std::binary_search(item_locations.begin(), item_locations.end(), i)) {
                num_pieces += min_pieces_per_location;
            }
            // Pieces held past milestone i must allow at least i + 1 merges.
            if (table.possible_merges[std::min(npieces, num_pieces)] > i) continue;

            std::vector<int> item_candidates;
            std::vector<int> filler_candidates;
            for (int loc : item_locations) if (loc > i) item_candidates.push_back(loc);
            for (int loc : filler_locations) if (loc <= i) filler_candidates.push_back(loc);
            if (item_candidates.empty() || filler_candidates.empty()) {
                throw InfeasibleConfigError("Failed to find location for milestone " + std::to_string(i));
            }
            if (++swaps > JigsawConfig::REPAIR_MAX_ITERATIONS) {
                throw InfeasibleConfigError("milestone repair did not settle after " +
                                            std::to_string(JigsawConfig::REPAIR_MAX_ITERATIONS) + " swaps");
            }

            const int chosen_item_loc = rng.choice(item_candidates);
            item_locations.erase(std::find(item_locations.begin(), item_locations.end(), chosen_item_loc));
            filler_locations.push_back(chosen_item_loc);

            const int chosen_filler_loc = rng.choice(filler_candidates);
            filler_locations.erase(std::find(filler_locations.begin(), filler_locations.end(), chosen_filler_loc));
            item_locations.push_back(chosen_filler_loc);

            std::sort(item_locations.begin(), item_locations.end());
            std::sort(filler_locations.begin(), filler_locations.end());
            do_again = true;
            break;
        }
    }
    return swaps;
}

LocationPlan plan_locations(const ProgressionTable& table, const PiecePlan& plan, int number_of_locations,
                            int percentage_of_extra_pieces, RandomSource& rng) {
    LocationPlan lp;
    const int npieces = table.npieces();
    const int pieces_left = count_pieces_left(static_cast<int>(plan.itempool.size()), percentage_of_extra_pieces);

    if (number_of_locations > 0) {
        lp.min_pieces_per_location = (pieces_left + number_of_locations - 1) / number_of_locations;
    }
    if (lp.min_pieces_per_location > JigsawConfig::MAX_PIECES_PER_LOCATION) {
        throw InfeasibleConfigError("Too many pieces per location (" + std::to_string(lp.min_pieces_per_location) + ")");
    }

    spread_locations(npieces, number_of_locations, lp.item_locations, lp.filler_locations);
    if (number_of_locations > 0) {
        lp.repair_swaps = repair_locations(table, static_cast<int>(plan.precollected.size()), lp.min_pieces_per_location,
                                           lp.item_locations, lp.filler_locations, rng);
    }
    return lp;
}
