#include "core/board.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

AdjacencyTable::AdjacencyTable(int width, int height) : w(width), h(height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("AdjacencyTable: grid dimensions must be positive");
    }
    table.resize(static_cast<size_t>(width) * height);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const int i = y * width + x;
            AdjList& adj = table[i];
            int cnt = 0;
            if (x > 0) adj.list[cnt++] = i - 1;
            if (x < width - 1) adj.list[cnt++] = i + 1;
            if (y > 0) adj.list[cnt++] = i - width;
            if (y < height - 1) adj.list[cnt++] = i + width;
            adj.count = static_cast<int8_t>(cnt);
        }
    }
}

GridSize calculate_optimal_grid(int number_of_pieces, double orientation) {
    if (number_of_pieces <= 0 || !std::isfinite(orientation) || !(orientation > 0.0)) {
        throw std::invalid_argument("calculate_optimal_grid: piece count and orientation must be positive and finite");
    }
    // nearbyint rounds half to even under the default rounding mode.
    const int h_pieces = std::max(1, static_cast<int>(std::nearbyint(std::sqrt(number_of_pieces * orientation))));
    const int v_pieces = static_cast<int>(std::nearbyint(static_cast<double>(number_of_pieces) / h_pieces));

    double err_min = std::numeric_limits<double>::infinity();
    GridSize best{h_pieces, v_pieces};

    for (int ky = 0; ky < 5; ++ky) {
        const int ncv = v_pieces + ky - 2;
        for (int kx = 0; kx < 5; ++kx) {
            const int nch = h_pieces + kx - 2;
            if (ncv < 1 || nch < 1) continue;
            double err = static_cast<double>(nch) / ncv / orientation;
            err = (err + 1.0 / err) - 2.0;  // piece aspect error
            err += std::abs(1.0 - static_cast<double>(nch) * ncv / number_of_pieces);  // piece count error
            if (err < err_min) {
                err_min = err;
                best = {nch, ncv};
            }
        }
    }
    return best;
}

PieceKind classify_piece(int piece, int nx, int ny) {
    const Coord c = index_to_coord(piece - 1, nx);
    const bool x_border = c.x == 0 || c.x == nx - 1;
    const bool y_border = c.y == 0 || c.y == ny - 1;
    if (x_border && y_border) return PieceKind::Corner;
    if (x_border || y_border) return PieceKind::Edge;
    return PieceKind::Normal;
}
