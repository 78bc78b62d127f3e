#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class PlayerState;

enum class ItemClassification { Filler, Progression };

struct Item {
    std::string name;
    std::optional<long long> code;  // nullopt: event / locked-only item
    ItemClassification classification;
    int player;

    bool advancement() const { return classification == ItemClassification::Progression; }
};

struct ItemData {
    std::optional<long long> code;
    ItemClassification classification;
};

inline const std::string PIECES_COUNTER = "pcs";
inline const std::string VICTORY_ITEM = "Victory";
inline const std::string FILLER_ITEM = "Squawks";

// "N Puzzle Piece(s)" for N in 1..MAX_PIECES_PER_ITEM, "Squawks", and the
// encouragement fillers.
const std::map<std::string, ItemData>& item_table();

std::string piece_bundle_name(int n);

// Pieces granted by collecting the named item; 0 for non-piece items.
int pieces_in_item(std::string_view name);

// Throws JigsawError for names outside item_table() (except "Victory").
Item create_item(const std::string& name, int player);

const std::vector<std::string>& encouragements();

using AccessRule = std::function<bool(const PlayerState&)>;

struct Location {
    std::string name;
    std::optional<long long> address;  // nullopt: event location
    int nmerges;
    int player;
    AccessRule access_rule;
    std::optional<Item> item;
    bool locked = false;

    bool can_reach(const PlayerState& state) const { return !access_rule || access_rule(state); }
    void place_locked_item(Item it) { item = std::move(it); locked = true; }
};

std::string location_name(int nmerges);
