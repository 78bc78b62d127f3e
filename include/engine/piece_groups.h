#pragma once
#include <vector>
#include "core/board.h"
#include "utils/options.h"
#include "utils/random.h"

using PieceGroups = std::vector<std::vector<int>>;

// --- Piece Kinds ---
// 1-based piece ids of the given kind, in row-major order.
std::vector<int> pieces_of_kind(int nx, int ny, PieceKind kind);

// --- Group Construction ---
// Priority groups handed to the planner: one shuffled group for RandomOrder,
// otherwise three groups in the named kind order. With strictness < 100 a share
// of each lower group bleeds into the group above it, then every group is
// shuffled again.
PieceGroups build_piece_groups(int nx, int ny, PieceTypeOrder order, int strictness, RandomSource& rng);

// Moves floor(|from| * fraction) pieces from the head of `from` to the back of `to`.
void move_percentage(std::vector<int>& from, std::vector<int>& to, double fraction);
