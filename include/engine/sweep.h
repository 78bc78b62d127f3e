#pragma once
#include "core/player_state.h"
#include "engine/world.h"

struct SweepResult {
    bool victory = false;
    int rounds = 0;
    int locations_checked = 0;
};

// Puts the item pool bundles on the item milestones in ascending order.
// Stands in for the host's fill when a world is generated on its own.
void fill_item_locations(JigsawWorld& world);

/**
 * @brief Replays the game logic for one player.
 *
 * Starts from the precollected bundles and repeatedly checks every reachable
 * location, collecting whatever it holds, until a round makes no progress.
 * The state must be bound to the world's puzzle (setup_player_state).
 */
SweepResult sweep_to_victory(const JigsawWorld& world, PlayerState& state);
