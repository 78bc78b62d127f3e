#include "utils/globals.h"
#include <cstdio>
#include <string>

// --- Global State Definitions ---

// Mutexes for thread safety
std::mutex console_mtx;
std::mutex db_mtx;

std::string format_board(int nx, int ny, const std::vector<int>& piece_order, int precollected) {
    std::vector<int> arrival(static_cast<size_t>(nx) * ny, -1);
    for (size_t k = 0; k < piece_order.size(); ++k) {
        const int cell = piece_order[k] - 1;
        if (cell >= 0 && cell < nx * ny) arrival[cell] = static_cast<int>(k);
    }

    const int width = static_cast<int>(std::to_string(piece_order.size()).size()) + 1;
    std::string s;
    for (int y = 0; y < ny; ++y) {
        for (int x = 0; x < nx; ++x) {
            const int k = arrival[y * nx + x];
            std::string cell = k < 0 ? "?" : (k < precollected ? "P" : std::to_string(k + 1));
            s += std::string(width - cell.size(), ' ') + cell;
        }
        s += '\n';
    }
    return s;
}

void print_board(int player, int nx, int ny, const std::vector<int>& piece_order, int precollected) {
    std::lock_guard<std::mutex> lock(console_mtx);
    std::printf("========================================\n");
    std::printf(" Player %d | %dx%d | %d precollected\n", player, nx, ny, precollected);
    std::printf("========================================\n");
    std::printf("%s\n", format_board(nx, ny, piece_order, precollected).c_str());
}
