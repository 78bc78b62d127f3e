#pragma once
#include <optional>
#include <string>
#include <vector>
#include "data/slot_data.h"

// Open / close. ":memory:" opens a private in-memory database.
bool init_db(const std::string& db_path);
void close_db();
bool db_is_open();

// Upsert keyed by (seed_name, player).
bool save_slot_data(const SlotData& data);

std::optional<SlotData> load_slot_data(const std::string& seed_name, int player);

// All players of one seed, ordered by player.
std::vector<SlotData> load_all_slot_data(const std::string& seed_name);
