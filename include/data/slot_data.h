#pragma once
#include <string>
#include <string_view>
#include <vector>

// The only artifact a client needs: enough to rebuild the access-rule table
// without re-running generation.
struct SlotData {
    std::string seed_name;
    int player = 0;
    int which_image = 1;
    double orientation = 1.0;
    int nx = 0;
    int ny = 0;
    std::vector<int> piece_order;
    std::vector<int> possible_merges;
    std::vector<int> actual_possible_merges;
    std::string ap_world_version;

    bool operator==(const SlotData&) const = default;
};

std::string serialize_int_list(const std::vector<int>& values);
// Throws OptionError on anything but comma-separated integers.
std::vector<int> parse_int_list(std::string_view text);

// One "key=value" line per field.
std::string serialize_slot_data(const SlotData& data);
// Throws OptionError on missing fields or malformed values.
SlotData parse_slot_data(std::string_view text);
