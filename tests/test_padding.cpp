#include "floodseg/core/errors.hpp"
#include "floodseg/tiling/padding.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <utility>
#include <vector>

using floodseg::Matrix2Df;
using namespace floodseg::tiling;

namespace {

Matrix2Df ramp(int rows, int cols) {
    Matrix2Df m(rows, cols);
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            m(y, x) = static_cast<float>(y * 100 + x);
        }
    }
    return m;
}

} // namespace

TEST_CASE("pad_reflect_mirrors_without_repeating_edge") {
    Matrix2Df a(1, 4);
    a << 1.0f, 2.0f, 3.0f, 4.0f;
    Matrix2Df p = pad_reflect(a, 6);

    REQUIRE(p.rows() == 6);
    REQUIRE(p.cols() == 6);
    // row: 1 2 3 4 | 3 2
    REQUIRE(p(0, 4) == Catch::Approx(3.0f));
    REQUIRE(p(0, 5) == Catch::Approx(2.0f));
}

TEST_CASE("pad_reflect_pads_only_right_and_bottom") {
    Matrix2Df a = ramp(100, 100);
    Matrix2Df p = pad_reflect(a, 256);

    REQUIRE(p.rows() == 256);
    REQUIRE(p.cols() == 256);
    REQUIRE(p.topLeftCorner(100, 100).isApprox(a));
    // reflected about row 99: row 100 mirrors row 98
    REQUIRE(p(100, 5) == Catch::Approx(a(98, 5)));
    REQUIRE(p(5, 101) == Catch::Approx(a(5, 97)));
}

TEST_CASE("pad_reflect_leaves_axis_at_target_untouched") {
    Matrix2Df a = ramp(256, 76);
    Matrix2Df p = pad_reflect(a, 256);
    REQUIRE(p.rows() == 256);
    REQUIRE(p.cols() == 256);
    REQUIRE(p.leftCols(76).isApprox(a));
}

TEST_CASE("pad_reflect_never_crops_larger_input") {
    Matrix2Df a = ramp(300, 10);
    Matrix2Df p = pad_reflect(a, 256);
    REQUIRE(p.rows() == 300);
    REQUIRE(p.cols() == 256);
}

TEST_CASE("pad_then_crop_restores_original") {
    const std::vector<std::pair<int, int>> sizes = {{100, 100}, {76, 256}, {1, 1}, {256, 256}, {5, 17}};
    for (const auto &[rows, cols] : sizes) {
        Matrix2Df a = ramp(rows, cols);
        PadExtent e = compute_pad_extent(cols, rows, 256);
        Matrix2Df restored = crop_padding(pad_reflect(a, 256), e);
        REQUIRE(restored.rows() == rows);
        REQUIRE(restored.cols() == cols);
        REQUIRE((restored.array() == a.array()).all());
    }
}

TEST_CASE("pad_reflect_applies_same_padding_to_all_channels") {
    std::vector<Matrix2Df> channels = {ramp(10, 20), ramp(10, 20) * 2.0f};
    auto padded = pad_reflect(channels, 32);
    REQUIRE(padded.size() == 2);
    REQUIRE(padded[1].isApprox(padded[0] * 2.0f));
}

TEST_CASE("pad_reflect_rejects_mismatched_channels") {
    std::vector<Matrix2Df> channels = {ramp(10, 20), ramp(11, 20)};
    REQUIRE_THROWS_AS(pad_reflect(channels, 32), floodseg::ShapeError);
}

TEST_CASE("compute_pad_extent_rejects_empty_input") {
    REQUIRE_THROWS_AS(compute_pad_extent(0, 10, 256), floodseg::ShapeError);
    REQUIRE(compute_pad_extent(256, 256, 256).empty());
}

TEST_CASE("crop_padding_rejects_too_small_array") {
    PadExtent e = compute_pad_extent(100, 100, 256);
    REQUIRE_THROWS_AS(crop_padding(ramp(50, 50), e), floodseg::ShapeError);
}
