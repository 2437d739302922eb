#include "board_renderer.hpp"

#include <algorithm>
#include <iostream>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>

namespace {

const cv::Scalar WHITE(255, 255, 255);
const cv::Scalar BLACK(0, 0, 0);
const cv::Scalar GREY(160, 160, 160);
const cv::Scalar BLUE(200, 90, 20);

void draw_digit(cv::Mat& img, int row, int col, int digit, int cell_px, const cv::Scalar& color) {
    const std::string text(1, static_cast<char>('0' + digit));
    const int font = cv::FONT_HERSHEY_SIMPLEX;
    const double scale = cell_px / 40.0;
    const int thickness = std::max(1, cell_px / 25);

    int baseline = 0;
    cv::Size size = cv::getTextSize(text, font, scale, thickness, &baseline);

    // Center the glyph inside the cell
    cv::Point origin(col * cell_px + (cell_px - size.width) / 2,
                     row * cell_px + (cell_px + size.height) / 2);
    cv::putText(img, text, origin, font, scale, color, thickness, cv::LINE_AA);
}

} // namespace

cv::Mat render_board(const Grid& puzzle, const std::optional<Grid>& solution, int cell_px) {
    const int side = GRID_SIZE * cell_px;
    cv::Mat img(side, side, CV_8UC3, WHITE);

    for (int i = 0; i <= GRID_SIZE; ++i) {
        bool box_line = (i % BOX_SIZE == 0);
        int pos = std::min(i * cell_px, side - 1);
        const cv::Scalar& color = box_line ? BLACK : GREY;
        int thickness = box_line ? 3 : 1;
        cv::line(img, {pos, 0}, {pos, side - 1}, color, thickness);
        cv::line(img, {0, pos}, {side - 1, pos}, color, thickness);
    }

    for (int r = 0; r < GRID_SIZE; ++r) {
        for (int c = 0; c < GRID_SIZE; ++c) {
            int given = puzzle[r * GRID_SIZE + c];
            if (given != 0) {
                draw_digit(img, r, c, given, cell_px, BLACK);
            } else if (solution && (*solution)[r * GRID_SIZE + c] != 0) {
                draw_digit(img, r, c, (*solution)[r * GRID_SIZE + c], cell_px, BLUE);
            }
        }
    }
    return img;
}

bool save_board(const cv::Mat& board, const std::string& path) {
    if (board.empty()) return false;
    try {
        return cv::imwrite(path, board);
    } catch (const cv::Exception& e) {
        std::cerr << "ERROR: Could not write " << path << ": " << e.what() << std::endl;
        return false;
    }
}
