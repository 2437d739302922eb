#pragma once

#include <optional>
#include <string>
#include <opencv2/core.hpp>

#include "sudoku_grid.hpp"

// Draws the puzzle givens in black. With a solution, the missing digits are drawn in blue.
cv::Mat render_board(const Grid& puzzle, const std::optional<Grid>& solution = std::nullopt, int cell_px = 60);

bool save_board(const cv::Mat& board, const std::string& path);
