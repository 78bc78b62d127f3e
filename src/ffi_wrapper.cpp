#include "core/board.h"
#include "core/puzzle_board.h"
#include "core/scoring.h"
#include "engine/progression.h"
#include <cmath>
#include <exception>
#include <vector>

#ifdef _WIN32
  #define EXPORT __declspec(dllexport)
#else
  #define EXPORT __attribute__((visibility("default")))
#endif

extern "C" {
    // Opaque tracker handle for the embedding host.
    typedef struct JigsawBoard JigsawBoard;

    // pieces: `count` 1-based ids. Returns -1 on bad ids or dimensions.
    EXPORT int jigsaw_merges_in(const int* pieces, int count, int width, int height) {
        if (count < 0 || (count > 0 && pieces == nullptr)) return -1;
        try {
            return merges_in(std::vector<int>(pieces, pieces + count), width, height);
        } catch (const std::exception&) {
            return -1;
        }
    }

    // possible_merges holds npieces + 1 entries; out receives npieces entries.
    EXPORT int jigsaw_pieces_needed_per_merge(const int* possible_merges, int npieces, int* out) {
        if (npieces <= 0 || possible_merges == nullptr || out == nullptr) return -1;
        try {
            const std::vector<int> needed = compute_pieces_needed_per_merge(
                std::vector<int>(possible_merges, possible_merges + npieces + 1), npieces);
            for (int m = 0; m < npieces; ++m) out[m] = needed[m];
            return 0;
        } catch (const std::exception&) {
            return -1;
        }
    }

    // orientation must be a finite width / height ratio above zero.
    EXPORT int jigsaw_optimal_grid(int number_of_pieces, double orientation, int* out_nx, int* out_ny) {
        if (number_of_pieces <= 0 || !std::isfinite(orientation) || !(orientation > 0.0)) return -1;
        if (out_nx == nullptr || out_ny == nullptr) return -1;
        try {
            const GridSize grid = calculate_optimal_grid(number_of_pieces, orientation);
            *out_nx = grid.nx;
            *out_ny = grid.ny;
            return 0;
        } catch (const std::exception&) {
            return -1;
        }
    }

    EXPORT JigsawBoard* jigsaw_board_new(int width, int height) {
        try {
            return reinterpret_cast<JigsawBoard*>(new PuzzleBoard(width, height));
        } catch (const std::exception&) {
            return nullptr;
        }
    }

    EXPORT void jigsaw_board_free(JigsawBoard* handle) {
        delete reinterpret_cast<PuzzleBoard*>(handle);
    }

    // Cells are 0-based. Returns the new merge count, or -1.
    EXPORT int jigsaw_board_add(JigsawBoard* handle, int cell) {
        if (handle == nullptr) return -1;
        auto* board = reinterpret_cast<PuzzleBoard*>(handle);
        try {
            board->add_piece(cell);
            return board->merges_count();
        } catch (const std::exception&) {
            return -1;
        }
    }

    EXPORT int jigsaw_board_remove(JigsawBoard* handle, int cell) {
        if (handle == nullptr) return -1;
        auto* board = reinterpret_cast<PuzzleBoard*>(handle);
        try {
            board->remove_piece(cell);
            return board->merges_count();
        } catch (const std::exception&) {
            return -1;
        }
    }

    EXPORT int jigsaw_board_merges_from_adding(const JigsawBoard* handle, int cell) {
        if (handle == nullptr) return -1;
        try {
            return reinterpret_cast<const PuzzleBoard*>(handle)->get_merges_from_adding_piece(cell);
        } catch (const std::exception&) {
            return -1;
        }
    }

    EXPORT int jigsaw_board_merges(const JigsawBoard* handle) {
        if (handle == nullptr) return -1;
        return reinterpret_cast<const PuzzleBoard*>(handle)->merges_count();
    }
}
