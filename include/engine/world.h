#pragma once
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include "core/player_state.h"
#include "data/items.h"
#include "data/slot_data.h"
#include "engine/planner.h"
#include "engine/progression.h"
#include "utils/options.h"
#include "utils/random.h"

/**
 * @brief One player's jigsaw world, from options to access rules.
 *
 * Stages mirror the host's generation calls:
 *  1. generate_early(): grid size, piece plan, progression table, milestone plan.
 *  2. create_items() / precollected_items(): bundles for the item pool and the
 *     start inventory.
 *  3. create_regions(): "Merge i times" locations with access rules, locked
 *     filler and the victory event.
 *  4. fill_slot_data(): the payload a client needs.
 * Any InfeasibleConfigError aborts the world; there is no partial result.
 */
class JigsawWorld {
public:
    JigsawWorld(int player, std::string seed_name, JigsawOptions options, uint64_t seed);

    void generate_early();
    std::vector<Item> create_items() const;
    std::vector<Item> precollected_items() const;
    void create_regions();

    std::vector<Location>& locations() { return all_locations; }
    const std::vector<Location>& locations() const { return all_locations; }
    Location& get_location(const std::string& name);

    // Binds the player's state to this world's grid and piece order.
    void setup_player_state(PlayerState& state) const;
    bool completion_condition(const PlayerState& state) const { return state.has(VICTORY_ITEM); }
    std::string get_filler_item_name() const { return FILLER_ITEM; }

    SlotData fill_slot_data() const;
    // Client side: rebuilds the progression table and rules without generating.
    void interpret_slot_data(const SlotData& data);
    void write_spoiler(std::ostream& out) const;

    void set_verbose(bool v) { verbose = v; }

    int player() const { return player_id; }
    int width() const { return nx; }
    int height() const { return ny; }
    int npieces() const { return nx * ny; }
    int number_of_locations() const { return num_locations; }
    const std::vector<int>& piece_order() const { return order; }
    const PiecePlan& plan() const { return pieces; }
    const ProgressionTable& progression() const { return table; }
    const LocationPlan& location_plan() const { return milestones; }
    const JigsawOptions& options() const { return opts; }

private:
    void install_access_rules();
    void log(const char* stage) const;

    int player_id;
    std::string seed_name;
    JigsawOptions opts;
    RandomSource rng;
    bool verbose = false;

    double orientation = 1.0;
    int nx = 0;
    int ny = 0;
    PiecePlan pieces;
    std::vector<int> order;
    ProgressionTable table;
    LocationPlan milestones;
    int num_locations = 0;
    std::vector<Location> all_locations;
};
