#include <atomic>
#include <cstdio>
#include <cstdint>
#include <exception>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "core/player_state.h"
#include "data/db_manager.h"
#include "engine/sweep.h"
#include "engine/world.h"
#include "utils/errors.h"
#include "utils/globals.h"
#include "utils/options.h"

namespace {

struct HostSettings {
    int players = 1;
    uint64_t seed = 1;
    std::string seed_name;
    std::string db_path = "jigsaw_slots.db";
    bool spoiler = false;
    bool quiet = false;
};

void print_usage() {
    std::printf("Usage: jigsaw_gen [--players=N] [--seed=S] [--seed-name=NAME] [--db=PATH]\n"
                "                  [--spoiler] [--quiet] [--<option>=<value> ...]\n");
}

// Host flags first; everything else must be a world option.
void parse_args(int argc, char* argv[], HostSettings& host, JigsawOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg.starts_with("--players=")) {
            host.players = std::stoi(std::string(arg.substr(10)));
        } else if (arg.starts_with("--seed=")) {
            host.seed = std::stoull(std::string(arg.substr(7)));
        } else if (arg.starts_with("--seed-name=")) {
            host.seed_name = std::string(arg.substr(12));
        } else if (arg.starts_with("--db=")) {
            host.db_path = std::string(arg.substr(5));
        } else if (arg == "--spoiler") {
            host.spoiler = true;
        } else if (arg == "--quiet") {
            host.quiet = true;
        } else if (!parse_option(opts, arg)) {
            throw OptionError("unknown argument '" + std::string(arg) + "'");
        }
    }
    if (host.players < 1 || host.players > 64) {
        throw OptionError("--players must be in [1, 64]");
    }
    if (host.seed_name.empty()) host.seed_name = "seed-" + std::to_string(host.seed);
}

bool run_player(int player, const HostSettings& host, const JigsawOptions& opts) {
    JigsawWorld world(player, host.seed_name, opts, host.seed ^ (static_cast<uint64_t>(player) << 16));
    world.set_verbose(!host.quiet);
    world.generate_early();
    world.create_regions();
    fill_item_locations(world);

    PlayerState state(player);
    world.setup_player_state(state);
    const SweepResult sweep = sweep_to_victory(world, state);

    if (!host.quiet) {
        std::lock_guard<std::mutex> lock(console_mtx);
        std::printf("[PLAYER %d] Sweep: %s after %d rounds, %d checks, %d merges held\n",
                    player, sweep.victory ? "victory" : "STUCK", sweep.rounds, sweep.locations_checked, state.merges());
    }
    if (!sweep.victory) {
        std::lock_guard<std::mutex> lock(console_mtx);
        std::fprintf(stderr, "[PLAYER %d] Logic sweep did not reach victory\n", player);
        return false;
    }

    if (db_is_open() && !save_slot_data(world.fill_slot_data())) return false;

    if (host.spoiler) {
        std::ostringstream out;
        world.write_spoiler(out);
        std::lock_guard<std::mutex> lock(console_mtx);
        std::printf("%s\n", out.str().c_str());
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        HostSettings host;
        JigsawOptions opts;
        try {
            parse_args(argc, argv, host, opts);
            validate_options(opts);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "[INIT] %s\n", e.what());
            print_usage();
            return 1;
        }

        if (!host.db_path.empty()) {
            if (!host.quiet) std::printf("[INIT] Opening slot database %s...\n", host.db_path.c_str());
            if (!init_db(host.db_path)) return 1;
        }

        if (!host.quiet) {
            std::printf("=== Jigsaw Progression Generator ===\n");
            std::printf("Seed: %s (%llu) | Players: %d | Pieces: %d (%s) | Order: %s / %s\n",
                        host.seed_name.c_str(), static_cast<unsigned long long>(host.seed), host.players,
                        opts.number_of_pieces, to_string(opts.orientation_of_image).c_str(),
                        to_string(opts.piece_order_type).c_str(),
                        to_string(opts.piece_order).c_str());
            std::printf("[INIT] Spawning %d player threads...\n", host.players);
        }

        std::atomic<int> failures{0};
        std::vector<std::thread> workers;
        for (int p = 1; p <= host.players; ++p) {
            workers.emplace_back([p, &host, &opts, &failures]() {
                try {
                    if (!run_player(p, host, opts)) ++failures;
                } catch (const std::exception& e) {
                    std::lock_guard<std::mutex> lock(console_mtx);
                    std::fprintf(stderr, "[PLAYER %d FAILED] %s\n", p, e.what());
                    ++failures;
                }
            });
        }
        for (auto& t : workers) t.join();

        close_db();
        if (failures > 0) {
            std::fprintf(stderr, "%d of %d player worlds failed.\n", failures.load(), host.players);
            return 1;
        }
        if (!host.quiet) std::printf("All player worlds generated.\n");
        return 0;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[MAIN CRASH] Uncaught Exception: %s\n", e.what());
        return 1;
    }
}
