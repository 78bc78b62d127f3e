#include "core/player_state.h"
#include "core/scoring.h"
#include <algorithm>
#include <stdexcept>
#include <string>

void MergeCache::invalidate() {
    std::lock_guard<std::mutex> lock(mtx);
    stale = true;
}

bool MergeCache::is_stale() const {
    std::lock_guard<std::mutex> lock(mtx);
    return stale;
}

int MergeCache::get(const PlayerState& state) const {
    std::lock_guard<std::mutex> lock(mtx);
    if (stale) {
        cached_value = state.width() > 0
            ? merges_in(state.held_piece_set(), state.width(), state.height())
            : 0;
        stale = false;
        ++recompute_count;
    }
    return cached_value;
}

int MergeCache::recomputations() const {
    std::lock_guard<std::mutex> lock(mtx);
    return recompute_count;
}

PlayerState::PlayerState(int player) : player_id(player) {}

void PlayerState::bind_puzzle(int width, int height, std::vector<int> order) {
    if (width <= 0 || height <= 0) throw std::invalid_argument("PlayerState: grid dimensions must be positive");
    const int cells = width * height;
    for (int piece : held_pieces) {
        if (piece > cells) throw std::out_of_range("PlayerState: held piece " + std::to_string(piece) + " outside the new grid");
    }
    std::vector<int> position(static_cast<size_t>(cells) + 1, -1);
    for (size_t k = 0; k < order.size(); ++k) {
        if (order[k] < 1 || order[k] > cells) {
            throw std::out_of_range("PlayerState: piece order holds " + std::to_string(order[k]) + " outside the grid");
        }
        position[order[k]] = static_cast<int>(k);
    }

    nx = width;
    ny = height;
    piece_order = std::move(order);
    order_position = std::move(position);
    cache.invalidate();
}

bool PlayerState::collect(const Item& item) {
    cache.invalidate();
    if (item.player != player_id || !item.advancement()) return false;
    ++prog_items[item.name];
    bundled_pieces += pieces_in_item(item.name);
    return true;
}

bool PlayerState::remove(const Item& item) {
    cache.invalidate();
    if (item.player != player_id || !item.advancement()) return false;
    auto it = prog_items.find(item.name);
    if (it == prog_items.end() || it->second == 0) return false;
    --it->second;
    bundled_pieces -= pieces_in_item(item.name);
    return true;
}

bool PlayerState::collect_piece(int piece) {
    cache.invalidate();
    if (nx == 0) throw std::logic_error("PlayerState: collect_piece before bind_puzzle");
    if (piece < 1 || piece > nx * ny) throw std::out_of_range("PlayerState: piece outside the grid");
    return held_pieces.insert(piece).second;
}

bool PlayerState::remove_piece(int piece) {
    cache.invalidate();
    return held_pieces.erase(piece) > 0;
}

bool PlayerState::covered_by_bundles(int piece) const {
    const int pos = order_position[piece];
    return pos >= 0 && pos < bundled_pieces;
}

int PlayerState::count(const std::string& name) const {
    if (name == PIECES_COUNTER) {
        int n = bundled_pieces;
        for (int piece : held_pieces) {
            if (!covered_by_bundles(piece)) ++n;
        }
        return n;
    }
    const auto it = prog_items.find(name);
    return it == prog_items.end() ? 0 : it->second;
}

std::vector<int> PlayerState::held_piece_set() const {
    const int prefix = std::clamp(bundled_pieces, 0, static_cast<int>(piece_order.size()));
    std::vector<int> out(piece_order.begin(), piece_order.begin() + prefix);
    for (int piece : held_pieces) {
        if (!covered_by_bundles(piece)) out.push_back(piece);
    }
    return out;
}
