#pragma once
#include <string_view>

namespace JigsawConfig {
    // Item & Location Id Space
    inline constexpr long long ITEM_BASE_ID = 234782000;      // "N Puzzle Pieces" -> base + N
    inline constexpr long long FILLER_ITEM_ID = 234781999;
    inline constexpr long long LOCATION_BASE_ID = 234782000;  // "Merge i times" -> base + i

    // Bundles
    inline constexpr int MAX_PIECES_PER_ITEM = 500;
    inline constexpr int MAX_PIECES_PER_LOCATION = 500;

    // Progression Table
    // Pieces with fewer than this many pieces left (itself included) get no slack.
    inline constexpr int NO_SLACK_TAIL = 10;

    // Milestone Repair
    inline int REPAIR_MAX_ITERATIONS = 100000;

    // Grid Limits
    inline constexpr int MIN_PIECES = 25;
    inline constexpr int MAX_PIECES = 1000;

    inline constexpr std::string_view AP_WORLD_VERSION = "0.4.0";
}
