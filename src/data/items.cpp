#include "data/items.h"
#include "utils/config.h"
#include "utils/errors.h"
#include <cctype>

const std::vector<std::string>& encouragements() {
    static const std::vector<std::string> names = {
        "Nice Merge!",
        "Keep Going!",
        "Almost There!",
        "Great Find!",
        "Puzzle Master!",
        "What A Fit!",
        "Snap!",
        "Corner Spotted!",
        "Edge Of Glory!",
        "One More Piece!",
    };
    return names;
}

const std::map<std::string, ItemData>& item_table() {
    static const std::map<std::string, ItemData> table = [] {
        std::map<std::string, ItemData> t;
        for (int n = 1; n <= JigsawConfig::MAX_PIECES_PER_ITEM; ++n) {
            t.emplace(piece_bundle_name(n), ItemData{JigsawConfig::ITEM_BASE_ID + n, ItemClassification::Progression});
        }
        t.emplace(FILLER_ITEM, ItemData{JigsawConfig::FILLER_ITEM_ID, ItemClassification::Filler});
        for (const auto& name : encouragements()) {
            t.emplace(name, ItemData{std::nullopt, ItemClassification::Filler});
        }
        return t;
    }();
    return table;
}

std::string piece_bundle_name(int n) {
    return std::to_string(n) + " Puzzle Piece" + (n > 1 ? "s" : "");
}

int pieces_in_item(std::string_view name) {
    if (name.find("Piece") == std::string_view::npos) return 0;
    int n = 0;
    size_t i = 0;
    while (i < name.size() && std::isdigit(static_cast<unsigned char>(name[i]))) {
        n = n * 10 + (name[i] - '0');
        ++i;
    }
    if (i == 0 || i >= name.size() || name[i] != ' ') return 1;
    return n;
}

Item create_item(const std::string& name, int player) {
    if (name == VICTORY_ITEM) return Item{name, std::nullopt, ItemClassification::Progression, player};
    const auto it = item_table().find(name);
    if (it == item_table().end()) throw JigsawError("unknown item '" + name + "'");
    return Item{name, it->second.code, it->second.classification, player};
}

std::string location_name(int nmerges) {
    return "Merge " + std::to_string(nmerges) + " times";
}
