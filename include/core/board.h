#pragma once
#include <array>
#include <cstdint>
#include <vector>

struct Coord { int y; int x; };

// In-bounds orthogonal neighbours of one cell, in left, right, up, down order.
struct AdjList { int8_t count; std::array<int, 4> list; };

/**
 * @brief Precomputed 4-way adjacency table for a width x height grid.
 * Cells are indexed row-major from 0. Built once, read-only afterwards.
 */
class AdjacencyTable {
public:
    AdjacencyTable(int width, int height);

    int width() const { return w; }
    int height() const { return h; }
    int size() const { return w * h; }
    const AdjList& operator[](int cell) const { return table[cell]; }

private:
    int w;
    int h;
    std::vector<AdjList> table;
};

inline int coord_to_index(Coord c, int width) { return c.y * width + c.x; }
inline Coord index_to_coord(int idx, int width) { return Coord{idx / width, idx % width}; }

struct GridSize { int nx; int ny; };

// Picks nx * ny close to number_of_pieces with pieces as square as possible
// for an image of the given width / height ratio.
GridSize calculate_optimal_grid(int number_of_pieces, double orientation);

enum class PieceKind { Corner, Edge, Normal };

// piece is 1-based.
PieceKind classify_piece(int piece, int nx, int ny);
