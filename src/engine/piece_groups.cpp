#include "engine/piece_groups.h"
#include <numeric>

std::vector<int> pieces_of_kind(int nx, int ny, PieceKind kind) {
    std::vector<int> out;
    for (int p = 1; p <= nx * ny; ++p) {
        if (classify_piece(p, nx, ny) == kind) out.push_back(p);
    }
    return out;
}

void move_percentage(std::vector<int>& from, std::vector<int>& to, double fraction) {
    const size_t move_count = static_cast<size_t>(static_cast<double>(from.size()) * fraction);
    if (move_count == 0) return;
    to.insert(to.end(), from.begin(), from.begin() + move_count);
    from.erase(from.begin(), from.begin() + move_count);
}

PieceGroups build_piece_groups(int nx, int ny, PieceTypeOrder order, int strictness, RandomSource& rng) {
    PieceGroups groups;

    if (order == PieceTypeOrder::RandomOrder) {
        std::vector<int> all(nx * ny);
        std::iota(all.begin(), all.end(), 1);
        rng.shuffle(all);
        groups.push_back(std::move(all));
    } else {
        std::vector<int> corners = pieces_of_kind(nx, ny, PieceKind::Corner);
        std::vector<int> edges = pieces_of_kind(nx, ny, PieceKind::Edge);
        std::vector<int> normal = pieces_of_kind(nx, ny, PieceKind::Normal);
        rng.shuffle(corners);
        rng.shuffle(edges);
        rng.shuffle(normal);

        switch (order) {
            case PieceTypeOrder::CornersEdgesNormal: groups = {corners, edges, normal}; break;
            case PieceTypeOrder::NormalEdgesCorners: groups = {normal, edges, corners}; break;
            case PieceTypeOrder::EdgesNormalCorners: groups = {edges, normal, corners}; break;
            case PieceTypeOrder::CornersNormalEdges: groups = {corners, normal, edges}; break;
            case PieceTypeOrder::NormalCornersEdges: groups = {normal, corners, edges}; break;
            case PieceTypeOrder::EdgesCornersNormal: groups = {edges, corners, normal}; break;
            case PieceTypeOrder::RandomOrder: break;
        }

        const double move_pieces = (100 - strictness) / 100.0;
        move_percentage(groups[2], groups[1], move_pieces);
        move_percentage(groups[1], groups[0], move_pieces);
    }

    for (auto& pieces : groups) rng.shuffle(pieces);
    return groups;
}
