#pragma once
#include <vector>

// Flood-fill reachability counting over an arbitrary set of 1-based piece ids.
// Independent of PuzzleBoard: no incremental state, safe to call concurrently.
// Duplicate ids count once; ids outside 1..width*height throw std::out_of_range.

// Number of 4-connected groups formed by the pieces.
int count_groups_in(const std::vector<int>& pieces, int width, int height);

// |pieces| - |groups|: the merge count of the held set, equal to replaying the
// pieces through a fresh PuzzleBoard in any order.
int merges_in(const std::vector<int>& pieces, int width, int height);
