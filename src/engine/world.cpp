#include "engine/world.h"
#include "core/board.h"
#include "utils/config.h"
#include "utils/errors.h"
#include "utils/globals.h"
#include <algorithm>
#include <cstdio>
#include <mutex>

JigsawWorld::JigsawWorld(int player, std::string seed_name, JigsawOptions options, uint64_t seed)
    : player_id(player), seed_name(std::move(seed_name)), opts(options), rng(seed)
{
}

void JigsawWorld::log(const char* stage) const {
    if (!verbose) return;
    std::lock_guard<std::mutex> lock(console_mtx);
    std::printf("[GEN] Player %d %s | %dx%d | precollected %zu | itempool %zu | checks %d x %d pcs | swaps %d\n",
                player_id, stage, nx, ny, pieces.precollected.size(), pieces.itempool.size(),
                num_locations, milestones.min_pieces_per_location, milestones.repair_swaps);
}

void JigsawWorld::generate_early() {
    validate_options(opts);

    orientation = opts.orientation_ratio();
    const GridSize grid = calculate_optimal_grid(opts.number_of_pieces, orientation);
    nx = grid.nx;
    ny = grid.ny;

    PiecePlanner planner(nx, ny, PlannerSettings::from_options(opts), rng);
    pieces = planner.plan();
    order = pieces.piece_order();

    table = build_progression_table(nx, ny, pieces, opts.number_of_checks_out_of_logic);

    num_locations = count_item_locations(npieces(), opts.percentage_of_merges_that_are_checks, opts.maximum_number_of_checks);
    if (num_locations == 0 && !pieces.itempool.empty()) {
        throw InfeasibleConfigError("no checks left to carry " + std::to_string(pieces.itempool.size()) + " pieces");
    }
    milestones = plan_locations(table, pieces, num_locations, opts.percentage_of_extra_pieces, rng);
    log("generate_early");
}

std::vector<Item> JigsawWorld::create_items() const {
    std::vector<Item> items;
    items.reserve(num_locations);
    const std::string name = piece_bundle_name(milestones.min_pieces_per_location);
    for (int i = 0; i < num_locations; ++i) items.push_back(create_item(name, player_id));
    return items;
}

std::vector<Item> JigsawWorld::precollected_items() const {
    std::vector<Item> items;
    int pieces_from_start = static_cast<int>(pieces.precollected.size());
    while (pieces_from_start > 0) {
        const int n = std::min(pieces_from_start, JigsawConfig::MAX_PIECES_PER_ITEM);
        items.push_back(create_item(piece_bundle_name(n), player_id));
        pieces_from_start -= n;
    }
    return items;
}

void JigsawWorld::create_regions() {
    all_locations.clear();
    const int max_score = npieces() - 1;
    all_locations.reserve(max_score);
    for (int i = 1; i <= max_score; ++i) {
        all_locations.push_back(Location{location_name(i), JigsawConfig::LOCATION_BASE_ID + i, i, player_id, nullptr, std::nullopt, false});
    }

    const std::vector<std::string> filler_names = rng.choices(encouragements(), milestones.filler_locations.size());
    for (size_t i = 0; i < milestones.filler_locations.size(); ++i) {
        all_locations[milestones.filler_locations[i] - 1].place_locked_item(create_item(filler_names[i], player_id));
    }

    install_access_rules();

    // The last merge is an event holding the victory marker.
    Location& victory = all_locations.back();
    victory.address = std::nullopt;
    victory.place_locked_item(create_item(VICTORY_ITEM, player_id));
    log("create_regions");
}

void JigsawWorld::install_access_rules() {
    for (Location& loc : all_locations) {
        const int m = loc.nmerges;
        if (opts.merge_based_logic) {
            loc.access_rule = [m](const PlayerState& state) { return state.merges() >= m; };
        } else {
            const int needed = table.pieces_needed_per_merge[m];
            loc.access_rule = [needed](const PlayerState& state) { return state.has(PIECES_COUNTER, needed); };
        }
    }
}

Location& JigsawWorld::get_location(const std::string& name) {
    const auto it = std::find_if(all_locations.begin(), all_locations.end(),
                                 [&](const Location& loc) { return loc.name == name; });
    if (it == all_locations.end()) throw JigsawError("unknown location '" + name + "'");
    return *it;
}

void JigsawWorld::setup_player_state(PlayerState& state) const {
    state.bind_puzzle(nx, ny, order);
}

SlotData JigsawWorld::fill_slot_data() const {
    SlotData data;
    data.seed_name = seed_name;
    data.player = player_id;
    data.which_image = opts.which_image;
    data.orientation = orientation;
    data.nx = nx;
    data.ny = ny;
    data.piece_order = order;
    data.possible_merges = table.possible_merges;
    data.actual_possible_merges = table.actual_possible_merges;
    data.ap_world_version = std::string(JigsawConfig::AP_WORLD_VERSION);
    return data;
}

void JigsawWorld::interpret_slot_data(const SlotData& data) {
    if (data.nx <= 0 || data.ny <= 0) throw JigsawError("slot data has no grid");
    const int n = data.nx * data.ny;
    if (static_cast<int>(data.piece_order.size()) != n || static_cast<int>(data.possible_merges.size()) != n + 1) {
        throw JigsawError("slot data tables do not match a " + std::to_string(data.nx) + "x" + std::to_string(data.ny) + " grid");
    }
    nx = data.nx;
    ny = data.ny;
    orientation = data.orientation;
    opts.which_image = data.which_image;
    order = data.piece_order;
    table.possible_merges = data.possible_merges;
    table.actual_possible_merges = data.actual_possible_merges;
    table.pieces_needed_per_merge = compute_pieces_needed_per_merge(table.possible_merges, n);
    if (!all_locations.empty()) install_access_rules();
}

void JigsawWorld::write_spoiler(std::ostream& out) const {
    out << "\nSpoiler and info for [Jigsaw] player " << player_id;
    out << "\nPuzzle dimension: " << nx << "x" << ny;
    out << "\nPrecollected pieces: " << pieces.precollected.size();
    out << "\nItempool pieces: " << pieces.itempool.size();
    out << "\nItem checks: " << milestones.item_locations.size()
        << " (" << milestones.min_pieces_per_location << " pieces each)";
    out << "\nFiller checks: " << milestones.filler_locations.size();
    out << "\nRepair swaps: " << milestones.repair_swaps;
    out << "\nPiece arrival order:\n" << format_board(nx, ny, order, static_cast<int>(pieces.precollected.size()));
}
