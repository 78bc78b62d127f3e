#pragma once
#include <mutex>
#include <string>
#include <vector>

// Shared by every player worker thread.
extern std::mutex console_mtx;
extern std::mutex db_mtx;

// Grid of collection indices: cell (x, y) shows when its piece arrives in
// piece_order, "P" for the first `precollected` pieces.
std::string format_board(int nx, int ny, const std::vector<int>& piece_order, int precollected);
void print_board(int player, int nx, int ny, const std::vector<int>& piece_order, int precollected);
