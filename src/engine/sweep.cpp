#include "engine/sweep.h"
#include "utils/errors.h"
#include <string>
#include <vector>

void fill_item_locations(JigsawWorld& world) {
    const std::vector<Item> items = world.create_items();
    const std::vector<int>& milestones = world.location_plan().item_locations;
    if (items.size() != milestones.size()) {
        throw JigsawError("item pool of " + std::to_string(items.size()) + " for " +
                          std::to_string(milestones.size()) + " item checks");
    }
    for (size_t i = 0; i < items.size(); ++i) {
        world.get_location(location_name(milestones[i])).item = items[i];
    }
}

SweepResult sweep_to_victory(const JigsawWorld& world, PlayerState& state) {
    SweepResult result;
    for (const Item& item : world.precollected_items()) state.collect(item);

    const std::vector<Location>& locations = world.locations();
    std::vector<bool> checked(locations.size(), false);

    bool progress = true;
    while (progress) {
        progress = false;
        ++result.rounds;
        for (size_t i = 0; i < locations.size(); ++i) {
            if (checked[i] || !locations[i].item) continue;
            if (!locations[i].can_reach(state)) continue;
            checked[i] = true;
            ++result.locations_checked;
            state.collect(*locations[i].item);
            progress = true;
        }
    }

    result.victory = world.completion_condition(state);
    return result;
}
