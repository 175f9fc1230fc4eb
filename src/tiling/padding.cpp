#include "floodseg/tiling/padding.hpp"
#include "floodseg/core/errors.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <string>

namespace floodseg::tiling {

PadExtent compute_pad_extent(int width, int height, int target_size) {
    if (width <= 0 || height <= 0) {
        throw ShapeError("cannot pad an empty array (" + std::to_string(width) + "x" +
                         std::to_string(height) + ")");
    }
    if (target_size <= 0) {
        throw ShapeError("target size must be positive, got " + std::to_string(target_size));
    }

    PadExtent e;
    e.original_width = width;
    e.original_height = height;
    e.pad_right = std::max(0, target_size - width);
    e.pad_bottom = std::max(0, target_size - height);
    return e;
}

Matrix2Df pad_reflect(const Matrix2Df& array, int target_size) {
    const PadExtent e = compute_pad_extent(static_cast<int>(array.cols()),
                                           static_cast<int>(array.rows()), target_size);
    if (e.empty()) {
        return array;
    }

    cv::Mat src(static_cast<int>(array.rows()), static_cast<int>(array.cols()), CV_32F,
                const_cast<float*>(array.data()));
    cv::Mat dst;
    cv::copyMakeBorder(src, dst, 0, e.pad_bottom, 0, e.pad_right, cv::BORDER_REFLECT_101);

    Matrix2Df out(dst.rows, dst.cols);
    for (int y = 0; y < dst.rows; ++y) {
        const float* row = dst.ptr<float>(y);
        std::copy(row, row + dst.cols, out.data() + static_cast<Eigen::Index>(y) * dst.cols);
    }
    return out;
}

std::vector<Matrix2Df> pad_reflect(const std::vector<Matrix2Df>& channels, int target_size) {
    std::vector<Matrix2Df> out;
    if (channels.empty()) return out;

    const Eigen::Index rows = channels.front().rows();
    const Eigen::Index cols = channels.front().cols();
    out.reserve(channels.size());
    for (size_t c = 0; c < channels.size(); ++c) {
        if (channels[c].rows() != rows || channels[c].cols() != cols) {
            throw ShapeError("channel " + std::to_string(c) + " is " +
                             std::to_string(channels[c].cols()) + "x" +
                             std::to_string(channels[c].rows()) + ", expected " +
                             std::to_string(cols) + "x" + std::to_string(rows));
        }
        out.push_back(pad_reflect(channels[c], target_size));
    }
    return out;
}

Matrix2Df crop_padding(const Matrix2Df& padded, const PadExtent& extent) {
    if (padded.cols() < extent.original_width || padded.rows() < extent.original_height) {
        throw ShapeError("padded array " + std::to_string(padded.cols()) + "x" +
                         std::to_string(padded.rows()) + " is smaller than original " +
                         std::to_string(extent.original_width) + "x" +
                         std::to_string(extent.original_height));
    }
    return padded.topLeftCorner(extent.original_height, extent.original_width);
}

} // namespace floodseg::tiling
