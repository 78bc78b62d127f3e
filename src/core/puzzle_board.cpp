#include "core/puzzle_board.h"
#include <algorithm>
#include <stdexcept>
#include <string>

PuzzleBoard::PuzzleBoard(int width, int height)
    : adj(width, height), board(static_cast<size_t>(width) * height, EMPTY), merges(0), placed(0)
{
    const int cells = width * height;
    const int max_isolated_pieces = cells / 2 + cells % 2;
    clusters.resize(max_isolated_pieces);
    unused_ids.reserve(max_isolated_pieces);
    for (int id = 0; id < max_isolated_pieces; ++id) unused_ids.push_back(id);
}

void PuzzleBoard::check_cell(int cell) const {
    if (cell < 0 || cell >= adj.size()) {
        throw std::out_of_range("PuzzleBoard: cell " + std::to_string(cell) + " outside the grid");
    }
}

int PuzzleBoard::collect_adjacent_clusters(int cell, std::array<int, 4>& out) const {
    const AdjList& nbrs = adj[cell];
    int found = 0;
    for (int i = 0; i < nbrs.count; ++i) {
        const int id = board[nbrs.list[i]];
        if (id == EMPTY) continue;
        if (std::find(out.begin(), out.begin() + found, id) == out.begin() + found) out[found++] = id;
    }
    return found;
}

void PuzzleBoard::add_piece(int cell) {
    check_cell(cell);
    if (board[cell] != EMPTY) {
        throw std::logic_error("PuzzleBoard::add_piece: cell " + std::to_string(cell) + " is already placed");
    }

    std::array<int, 4> found{};
    const int num_adjacent = collect_adjacent_clusters(cell, found);
    ++placed;

    if (num_adjacent == 0) {
        if (unused_ids.empty()) throw std::logic_error("PuzzleBoard: cluster id pool exhausted");
        const int new_id = unused_ids.back();
        unused_ids.pop_back();
        board[cell] = new_id;
        clusters[new_id].push_back(cell);
        return;
    }

    if (num_adjacent == 1) {
        ++merges;
        board[cell] = found[0];
        clusters[found[0]].push_back(cell);
        return;
    }

    merges += num_adjacent;

    int largest = found[0];
    for (int i = 1; i < num_adjacent; ++i) {
        if (clusters[found[i]].size() > clusters[largest].size()) largest = found[i];
    }

    std::vector<int>& target = clusters[largest];
    board[cell] = largest;
    target.push_back(cell);

    for (int i = 0; i < num_adjacent; ++i) {
        const int id = found[i];
        if (id == largest) continue;
        for (int piece : clusters[id]) board[piece] = largest;
        target.insert(target.end(), clusters[id].begin(), clusters[id].end());
        clusters[id].clear();
        unused_ids.push_back(id);
    }
}

int PuzzleBoard::get_merges_from_adding_piece(int cell) const {
    check_cell(cell);
    if (board[cell] != EMPTY) {
        throw std::logic_error("PuzzleBoard::get_merges_from_adding_piece: cell " + std::to_string(cell) + " is already placed");
    }
    std::array<int, 4> found{};
    return collect_adjacent_clusters(cell, found);
}

int PuzzleBoard::remove_piece(int cell) {
    check_cell(cell);
    const int cluster_id = board[cell];
    if (cluster_id == EMPTY) return 0;

    const int merges_before = merges;
    std::vector<int> members = std::move(clusters[cluster_id]);
    clusters[cluster_id].clear();
    unused_ids.push_back(cluster_id);

    for (int piece : members) board[piece] = EMPTY;
    members.erase(std::find(members.begin(), members.end(), cell));

    // A cluster of n pieces contributed n - 1 merges.
    merges -= static_cast<int>(members.size());
    placed -= static_cast<int>(members.size()) + 1;

    for (int piece : members) add_piece(piece);
    return merges - merges_before;
}

bool PuzzleBoard::has_piece(int cell) const {
    check_cell(cell);
    return board[cell] != EMPTY;
}

int PuzzleBoard::cluster_of(int cell) const {
    check_cell(cell);
    return board[cell];
}

const std::vector<int>& PuzzleBoard::cluster_members(int cluster_id) const {
    if (cluster_id < 0 || cluster_id >= id_capacity()) {
        throw std::out_of_range("PuzzleBoard: cluster id " + std::to_string(cluster_id) + " outside the pool");
    }
    return clusters[cluster_id];
}

bool PuzzleBoard::validate() const {
    std::vector<char> is_free(clusters.size(), 0);
    for (int id : unused_ids) {
        if (is_free[id]) return false;
        is_free[id] = 1;
        if (!clusters[id].empty()) return false;
    }

    int members_total = 0;
    int active = 0;
    for (int id = 0; id < id_capacity(); ++id) {
        if (is_free[id]) continue;
        if (clusters[id].empty()) return false;
        ++active;
        for (int piece : clusters[id]) {
            if (board[piece] != id) return false;
            ++members_total;
        }
    }

    int occupied = 0;
    for (int cell = 0; cell < adj.size(); ++cell) {
        if (board[cell] == EMPTY) continue;
        ++occupied;
        const AdjList& nbrs = adj[cell];
        for (int i = 0; i < nbrs.count; ++i) {
            const int other = board[nbrs.list[i]];
            if (other != EMPTY && other != board[cell]) return false;
        }
    }

    return occupied == placed && members_total == placed && merges == placed - active;
}
