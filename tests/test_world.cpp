#include <cassert>
#include <clocale>
#include <cstdio>
#include <sstream>
#include <string>
#include <vector>
#include "core/board.h"
#include "core/player_state.h"
#include "data/db_manager.h"
#include "data/slot_data.h"
#include "engine/sweep.h"
#include "engine/world.h"
#include "utils/config.h"
#include "utils/errors.h"
#include "utils/options.h"

void test_option_parsing() {
    std::printf("[TEST] Option parsing and validation...\n");
    JigsawOptions opts;
    assert(parse_option(opts, "--number_of_pieces=100"));
    assert(parse_option(opts, "--piece_order=least_merges_possible"));
    assert(parse_option(opts, "piece_order_type=edges_corners_normal"));
    assert(parse_option(opts, "--merge_based_logic=true"));
    assert(parse_option(opts, "--orientation_of_image=custom"));
    assert(parse_option(opts, "--width_of_image=300"));
    assert(parse_option(opts, "--height_of_image=200"));
    assert(opts.number_of_pieces == 100);
    assert(opts.piece_order == PieceOrderStrategy::LeastMergesPossible);
    assert(opts.piece_order_type == PieceTypeOrder::EdgesCornersNormal);
    assert(opts.merge_based_logic);
    assert(opts.orientation_ratio() == 1.5);
    validate_options(opts);

    assert(!parse_option(opts, "--no_such_option=1"));
    assert(!parse_option(opts, "--spoiler"));

    bool threw = false;
    try {
        parse_option(opts, "--number_of_pieces=lots");
    } catch (const OptionError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    opts.number_of_checks_out_of_logic = 16;
    try {
        validate_options(opts);
    } catch (const OptionError&) {
        threw = true;
    }
    assert(threw);

    assert(item_table().size() == static_cast<size_t>(JigsawConfig::MAX_PIECES_PER_ITEM) + 1 + encouragements().size());
    assert(parse_orientation(to_string(Orientation::Portrait)) == Orientation::Portrait);
    assert(parse_piece_order_strategy(to_string(PieceOrderStrategy::EveryPieceFits)) == PieceOrderStrategy::EveryPieceFits);
    std::printf(" -> PASS\n");
}

void test_optimal_grid() {
    std::printf("[TEST] Grid sizing...\n");
    const GridSize square = calculate_optimal_grid(25, 1.0);
    assert(square.nx == 5 && square.ny == 5);
    const GridSize landscape = calculate_optimal_grid(100, 1.5);
    assert(landscape.nx == 12 && landscape.ny == 8);
    const GridSize portrait = calculate_optimal_grid(100, 0.8);
    assert(portrait.nx < portrait.ny);
    std::printf(" -> PASS\n");
}

JigsawWorld generate(const JigsawOptions& opts, uint64_t seed, int player = 1) {
    JigsawWorld world(player, "unit", opts, seed);
    world.generate_early();
    world.create_regions();
    fill_item_locations(world);
    return world;
}

void check_world_reaches_victory(const JigsawOptions& opts, uint64_t seed) {
    JigsawWorld world = generate(opts, seed);
    const int n = world.npieces();

    assert(static_cast<int>(world.locations().size()) == n - 1);
    const Location& victory = world.locations().back();
    assert(!victory.address);
    assert(victory.item && victory.item->name == VICTORY_ITEM && victory.locked);

    int bundled = 0;
    for (const Item& item : world.create_items()) bundled += pieces_in_item(item.name);
    assert(bundled >= static_cast<int>(world.plan().itempool.size()));
    int start = 0;
    for (const Item& item : world.precollected_items()) start += pieces_in_item(item.name);
    assert(start == static_cast<int>(world.plan().precollected.size()));

    const Item filler = create_item(world.get_filler_item_name(), 1);
    assert(filler.code == JigsawConfig::FILLER_ITEM_ID && !filler.advancement());

    for (int m : world.location_plan().filler_locations) {
        const Location& loc = world.get_location(location_name(m));
        assert(loc.locked && loc.item && !loc.item->advancement());
    }

    PlayerState state(1);
    world.setup_player_state(state);
    const SweepResult sweep = sweep_to_victory(world, state);
    assert(sweep.victory);
    assert(world.completion_condition(state));
    assert(state.merges() == n - 1);
}

void test_generation_reaches_victory() {
    std::printf("[TEST] Generated worlds are beatable...\n");
    JigsawOptions opts;
    for (uint64_t seed = 1; seed <= 4; ++seed) check_world_reaches_victory(opts, seed);

    opts.number_of_pieces = 60;
    opts.number_of_checks_out_of_logic = 5;
    opts.piece_order = PieceOrderStrategy::LeastMergesPossible;
    for (uint64_t seed = 1; seed <= 3; ++seed) check_world_reaches_victory(opts, seed);

    opts.piece_order_type = PieceTypeOrder::RandomOrder;
    opts.piece_order = PieceOrderStrategy::RandomOrder;
    opts.merge_based_logic = true;
    for (uint64_t seed = 1; seed <= 3; ++seed) check_world_reaches_victory(opts, seed);
    std::printf(" -> PASS\n");
}

void test_no_checks_is_infeasible() {
    std::printf("[TEST] Zero checks with pieces to hand out throws...\n");
    JigsawOptions opts;
    opts.percentage_of_merges_that_are_checks = 0;
    JigsawWorld world(1, "unit", opts, 7);
    bool threw = false;
    try {
        world.generate_early();
    } catch (const InfeasibleConfigError&) {
        threw = true;
    }
    assert(threw);
    std::printf(" -> PASS\n");
}

void test_slot_data_round_trip() {
    std::printf("[TEST] Slot data text and client rebuild...\n");
    JigsawOptions opts;
    opts.number_of_pieces = 40;
    opts.orientation_of_image = Orientation::Landscape;
    opts.number_of_checks_out_of_logic = 3;
    const JigsawWorld world = generate(opts, 11);
    const SlotData data = world.fill_slot_data();
    assert(data.nx == world.width() && data.ny == world.height());
    assert(data.piece_order == world.piece_order());

    const SlotData parsed = parse_slot_data(serialize_slot_data(data));
    assert(parsed == data);

    JigsawWorld client(1, "unit", JigsawOptions{}, 0);
    client.interpret_slot_data(parsed);
    assert(client.progression().pieces_needed_per_merge == world.progression().pieces_needed_per_merge);

    // Same seed, same payload.
    assert(generate(opts, 11).fill_slot_data() == data);

    std::ostringstream spoiler;
    world.write_spoiler(spoiler);
    assert(spoiler.str().find("Puzzle dimension: " + std::to_string(world.width()) + "x") != std::string::npos);

    bool threw = false;
    try {
        parse_slot_data("seed_name=x\nplayer=1\n");
    } catch (const OptionError&) {
        threw = true;
    }
    assert(threw);
    std::printf(" -> PASS\n");
}

void test_slot_data_ignores_locale() {
    std::printf("[TEST] Slot data orientation under a comma-decimal locale...\n");
    SlotData data;
    data.seed_name = "locale";
    data.player = 1;
    data.orientation = 1.5;
    data.nx = 3;
    data.ny = 2;
    data.piece_order = {1, 2, 3, 4, 5, 6};

    const std::string text = serialize_slot_data(data);
    assert(text.find("orientation=1.5\n") != std::string::npos);

    const char* decimal_comma[] = {"de_DE.UTF-8", "de_DE.utf8", "fr_FR.UTF-8", "fr_FR.utf8"};
    const char* switched = nullptr;
    for (const char* name : decimal_comma) {
        if (std::setlocale(LC_NUMERIC, name) != nullptr) {
            switched = name;
            break;
        }
    }
    if (switched == nullptr) std::printf("  (no comma-decimal locale installed, checking C locale only)\n");

    const std::string localized = serialize_slot_data(data);
    const SlotData parsed = parse_slot_data(localized);
    std::setlocale(LC_NUMERIC, "C");

    assert(localized == text);
    assert(parsed.orientation == 1.5);
    assert(parse_slot_data(text) == parsed);
    std::printf(" -> PASS\n");
}

void test_sqlite_round_trip() {
    std::printf("[TEST] SQLite slot data persistence...\n");
    assert(init_db(":memory:"));
    assert(db_is_open());

    JigsawOptions opts;
    const SlotData first = generate(opts, 21, 1).fill_slot_data();
    const SlotData second = generate(opts, 22, 2).fill_slot_data();
    assert(save_slot_data(first));
    assert(save_slot_data(second));

    const auto loaded = load_slot_data("unit", 1);
    assert(loaded && *loaded == first);
    assert(!load_slot_data("unit", 3));
    assert(!load_slot_data("other", 1));

    // Upsert replaces the row for the same (seed_name, player).
    SlotData changed = first;
    changed.which_image = 7;
    assert(save_slot_data(changed));
    const std::vector<SlotData> all = load_all_slot_data("unit");
    assert(all.size() == 2);
    assert(all[0] == changed && all[1] == second);

    close_db();
    assert(!db_is_open());
    assert(!save_slot_data(first));
    std::printf(" -> PASS\n");
}

int main() {
    std::printf("=== World Generation Tests ===\n");
    test_option_parsing();
    test_optimal_grid();
    test_generation_reaches_victory();
    test_no_checks_is_infeasible();
    test_slot_data_round_trip();
    test_slot_data_ignores_locale();
    test_sqlite_round_trip();
    std::printf("All tests passed.\n");
    return 0;
}
