#pragma once
#include "data/items.h"
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

class PlayerState;

/**
 * @brief Read-through cache of a player's merge count.
 *
 * Starts stale. Every collect/remove on the owning PlayerState marks it stale;
 * the next query recomputes through merges_in() and clears the flag.
 * The mutex makes the flag/value pair one unit, so one player's state may be
 * queried from several logic threads as long as mutations are serialized by
 * the caller.
 */
class MergeCache {
public:
    MergeCache() = default;
    MergeCache(const MergeCache&) = delete;
    MergeCache& operator=(const MergeCache&) = delete;

    void invalidate();
    bool is_stale() const;
    int get(const PlayerState& state) const;
    int recomputations() const;

private:
    mutable std::mutex mtx;
    mutable bool stale = true;
    mutable int cached_value = 0;
    mutable int recompute_count = 0;
};

// One player's collected-item state as seen by the access rules.
class PlayerState {
public:
    explicit PlayerState(int player);

    // Grid and committed piece order used to turn bundle counts into pieces.
    // Throws std::out_of_range if an explicitly held piece is outside the new
    // grid or the order holds an id outside it; the state is left unchanged.
    void bind_puzzle(int nx, int ny, std::vector<int> piece_order);

    // Items of other players and filler items leave the state unchanged and
    // return false. Every call marks the merge cache stale.
    bool collect(const Item& item);
    bool remove(const Item& item);

    // Explicit single-piece holding (1-based id). Needs a bound grid:
    // throws std::logic_error before bind_puzzle, std::out_of_range for ids
    // outside the grid.
    bool collect_piece(int piece);
    bool remove_piece(int piece);

    bool has(const std::string& name, int count = 1) const { return this->count(name) >= count; }
    // For PIECES_COUNTER: bundled pieces plus explicit pieces the bundled
    // prefix of the piece order does not already cover.
    int count(const std::string& name) const;
    int pieces() const { return count(PIECES_COUNTER); }

    // Explicit pieces plus the first `bundled pieces` entries of the piece order.
    std::vector<int> held_piece_set() const;
    int merges() const { return cache.get(*this); }
    const MergeCache& merge_cache() const { return cache; }

    int player() const { return player_id; }
    int width() const { return nx; }
    int height() const { return ny; }

private:
    bool covered_by_bundles(int piece) const;

    int player_id;
    int nx = 0;
    int ny = 0;
    std::vector<int> piece_order;
    std::vector<int> order_position;  // piece id -> index in piece_order, -1 if absent
    std::map<std::string, int> prog_items;
    std::set<int> held_pieces;
    int bundled_pieces = 0;
    MergeCache cache;
};
