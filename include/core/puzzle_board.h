#pragma once
#include "core/board.h"
#include <array>
#include <vector>

/**
 * @brief Incremental cluster tracker for pieces placed on the puzzle grid.
 *
 * Every placed cell holds the id of its cluster; every cluster owns the list of
 * its cells. Ids come from a bounded pool of ceil(W*H/2) slots, the most
 * clusters that can be isolated at once, and are recycled through a free stack.
 *
 * Placement rules:
 *  - no neighbouring cluster: the cell opens a new cluster, merges unchanged.
 *  - one neighbouring cluster: the cell joins it, merges += 1.
 *  - k >= 2 neighbouring clusters: merges += k, the largest cluster (first
 *    found on ties) absorbs the others and their ids go back to the pool.
 *
 * The merge count is the progression metric used by the access rules; it is
 * always (#placed pieces) - (#clusters).
 */
class PuzzleBoard {
public:
    static constexpr int EMPTY = -1;

    PuzzleBoard(int width, int height);

    // Throws std::logic_error if the cell is already occupied.
    void add_piece(int cell);

    // Merge delta add_piece(cell) would produce. No side effects.
    // Throws std::logic_error if the cell is already occupied.
    int get_merges_from_adding_piece(int cell) const;

    // Drops the whole cluster of `cell` and re-adds its other members.
    // Cost is proportional to the cluster size. Returns the merge delta (<= 0);
    // an empty cell is left alone and yields 0.
    int remove_piece(int cell);

    bool has_piece(int cell) const;
    int cluster_of(int cell) const;
    const std::vector<int>& cluster_members(int cluster_id) const;

    int merges_count() const { return merges; }
    int piece_count() const { return placed; }
    int cluster_count() const { return id_capacity() - free_id_count(); }
    int free_id_count() const { return static_cast<int>(unused_ids.size()); }
    int id_capacity() const { return static_cast<int>(clusters.size()); }
    const AdjacencyTable& adjacency() const { return adj; }

    // Full consistency check of the cluster bookkeeping (test/debug aid).
    bool validate() const;

private:
    void check_cell(int cell) const;
    // Distinct neighbouring cluster ids in adjacency order; returns their count.
    int collect_adjacent_clusters(int cell, std::array<int, 4>& out) const;

    AdjacencyTable adj;
    std::vector<int> board;
    std::vector<std::vector<int>> clusters;
    std::vector<int> unused_ids;
    int merges;
    int placed;
};
