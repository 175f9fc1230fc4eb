#include "floodseg/core/errors.hpp"
#include "floodseg/tiling/mask_stitcher.hpp"
#include "floodseg/tiling/window_planner.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <vector>

using floodseg::Matrix2Df;
using floodseg::StitchPolicy;
using floodseg::TilePlan;
using floodseg::Window;
using namespace floodseg::tiling;

namespace {

Matrix2Df full_image(int width, int height) {
    Matrix2Df m(height, width);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            m(y, x) = static_cast<float>((x * 7 + y * 13) % 10) / 10.0f;
        }
    }
    return m;
}

std::vector<Matrix2Df> crops_of(const Matrix2Df& image, const TilePlan& plan) {
    std::vector<Matrix2Df> out;
    for (const Window& w : plan.windows) {
        out.push_back(image.block(w.y_off, w.x_off, w.height, w.width));
    }
    return out;
}

} // namespace

TEST_CASE("stitching_consistent_crops_reproduces_image_for_every_policy") {
    const Matrix2Df image = full_image(300, 300);
    const TilePlan plan = plan_windows(300, 300, 256, 32);
    const auto crops = crops_of(image, plan);

    for (StitchPolicy p : {StitchPolicy::LAST_WRITE, StitchPolicy::MEAN,
                           StitchPolicy::MAX_CONFIDENCE}) {
        Matrix2Df out = stitch_masks(plan, crops, 300, 300, p);
        REQUIRE(out.rows() == 300);
        REQUIRE(out.cols() == 300);
        REQUIRE(out.isApprox(image, 1e-6f));
    }
}

TEST_CASE("stitching_uses_top_left_block_of_padded_prediction") {
    const Matrix2Df image = full_image(100, 100);
    const TilePlan plan = plan_windows(100, 100, 256, 32);
    Matrix2Df padded = Matrix2Df::Constant(256, 256, 9.0f);
    padded.topLeftCorner(100, 100) = image;

    Matrix2Df out = stitch_masks(plan, {padded}, 100, 100);
    REQUIRE((out.array() == image.array()).all());
}

TEST_CASE("stitching_overlap_policies_resolve_conflicts") {
    // two windows overlapping in columns 6..7
    const TilePlan plan = plan_windows(12, 6, 8, 2);
    REQUIRE(plan.windows.size() == 2);

    std::vector<Matrix2Df> preds = {Matrix2Df::Constant(8, 8, 0.2f),
                                    Matrix2Df::Constant(8, 8, 0.6f)};

    Matrix2Df last = stitch_masks(plan, preds, 12, 6, StitchPolicy::LAST_WRITE);
    REQUIRE(last(0, 6) == Catch::Approx(0.6f));
    REQUIRE(last(0, 5) == Catch::Approx(0.2f));

    Matrix2Df mean = stitch_masks(plan, preds, 12, 6, StitchPolicy::MEAN);
    REQUIRE(mean(0, 6) == Catch::Approx(0.4f));
    REQUIRE(mean(0, 9) == Catch::Approx(0.6f));

    std::vector<Matrix2Df> reversed = {preds[1], preds[0]};
    Matrix2Df maxc = stitch_masks(plan, reversed, 12, 6, StitchPolicy::MAX_CONFIDENCE);
    REQUIRE(maxc(3, 7) == Catch::Approx(0.6f));
    REQUIRE(maxc(3, 9) == Catch::Approx(0.2f));
}

TEST_CASE("stitcher_rejects_out_of_order_tiles") {
    const TilePlan plan = plan_windows(20, 20, 8, 0);
    MaskStitcher stitcher(plan);
    REQUIRE_THROWS_AS(stitcher.add(1, Matrix2Df::Zero(8, 8)), floodseg::PipelineError);
    stitcher.add(0, Matrix2Df::Zero(8, 8));
    REQUIRE(stitcher.tiles_added() == 1);
}

TEST_CASE("stitcher_result_requires_all_tiles") {
    const TilePlan plan = plan_windows(20, 20, 8, 0);
    MaskStitcher stitcher(plan);
    stitcher.add(0, Matrix2Df::Zero(8, 8));
    REQUIRE_FALSE(stitcher.complete());
    REQUIRE_THROWS_AS(stitcher.result(), floodseg::PipelineError);
}

TEST_CASE("stitcher_rejects_prediction_smaller_than_window") {
    const TilePlan plan = plan_windows(20, 20, 8, 0);
    MaskStitcher stitcher(plan);
    REQUIRE_THROWS_AS(stitcher.add(0, Matrix2Df::Zero(4, 8)), floodseg::ShapeError);
}

TEST_CASE("stitch_masks_rejects_mismatched_inputs") {
    const TilePlan plan = plan_windows(20, 20, 8, 0);
    std::vector<Matrix2Df> preds(plan.windows.size(), Matrix2Df::Zero(8, 8));
    REQUIRE_THROWS_AS(stitch_masks(plan, preds, 21, 20), floodseg::ShapeError);
    preds.pop_back();
    REQUIRE_THROWS_AS(stitch_masks(plan, preds, 20, 20), floodseg::ShapeError);
}

TEST_CASE("threshold_mask_is_inclusive") {
    Matrix2Df c(1, 3);
    c << 0.49f, 0.5f, 0.9f;
    Matrix2Df m = threshold_mask(c, 0.5f);
    REQUIRE(m(0, 0) == 0.0f);
    REQUIRE(m(0, 1) == 1.0f);
    REQUIRE(m(0, 2) == 1.0f);
}

TEST_CASE("stitching_twice_is_identical") {
    const TilePlan plan = plan_windows(300, 300, 256, 32);
    std::vector<Matrix2Df> preds;
    for (std::size_t i = 0; i < plan.windows.size(); ++i) {
        // disagreeing tiles so every policy has overlaps to resolve
        preds.push_back(Matrix2Df::Constant(256, 256, 0.1f + 0.2f * static_cast<float>(i)));
    }

    for (StitchPolicy p : {StitchPolicy::LAST_WRITE, StitchPolicy::MEAN,
                           StitchPolicy::MAX_CONFIDENCE}) {
        const Matrix2Df first = stitch_masks(plan, preds, 300, 300, p);
        const Matrix2Df second = stitch_masks(plan, preds, 300, 300, p);
        REQUIRE((first.array() == second.array()).all());

        MaskStitcher stitcher(plan, p);
        for (std::size_t i = 0; i < preds.size(); ++i) {
            stitcher.add(static_cast<int>(i), preds[i]);
        }
        REQUIRE((stitcher.result().array() == first.array()).all());
    }
}
