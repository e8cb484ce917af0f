/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "losses/color_loss.hpp"
#include <gtest/gtest.h>
#include <torch/torch.h>

using namespace srl::losses;
using srl::core::param::AverageLossParameters;
using srl::core::param::ColorLossParameters;
using srl::core::param::Criterion;

namespace {

    class ColorLossTest : public ::testing::Test {
    protected:
        void SetUp() override {
            torch::manual_seed(42);
            input = torch::rand({2, 3, 8, 8});
            target = torch::rand({2, 3, 8, 8});
        }

        torch::Tensor input;
        torch::Tensor target;
    };

} // namespace

TEST_F(ColorLossTest, GrayPixelsHaveNeutralChroma) {
    const auto gray = torch::full({1, 3, 2, 2}, 0.3f);
    const auto cbcr = rgb_to_cbcr(gray);
    EXPECT_EQ(cbcr.sizes(), (std::vector<int64_t>{1, 2, 2, 2}));
    EXPECT_TRUE(torch::allclose(cbcr, torch::full_like(cbcr, 0.5f), 1e-5, 1e-6));
}

TEST_F(ColorLossTest, PureRedChroma) {
    const auto red = torch::tensor({1.0f, 0.0f, 0.0f}).view({1, 3, 1, 1});
    const auto cbcr = rgb_to_cbcr(red);
    EXPECT_NEAR(cbcr.index({0, 0, 0, 0}).item<float>(), -0.299f * 0.564f + 0.5f, 1e-6f);
    EXPECT_NEAR(cbcr.index({0, 1, 0, 0}).item<float>(), 0.701f * 0.713f + 0.5f, 1e-6f);
}

TEST_F(ColorLossTest, LuminanceChangeIsIgnored) {
    auto loss = ColorLoss::create({});
    ASSERT_TRUE(loss.has_value());

    // Adding the same offset to every channel shifts Y only
    auto result = loss->forward(input, input + 0.2f);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_NEAR(result->item<float>(), 0.0f, 1e-6f);
}

TEST_F(ColorLossTest, MatchesCriterionOnChroma) {
    ColorLossParameters params;
    params.criterion = Criterion::L1;
    params.loss_weight = 2.0f;
    auto loss = ColorLoss::create(params);
    ASSERT_TRUE(loss.has_value());

    auto result = loss->forward(input, target);
    ASSERT_TRUE(result.has_value());
    const auto expected = 2.0f * (rgb_to_cbcr(input) - rgb_to_cbcr(target)).abs().mean();
    EXPECT_NEAR(result->item<float>(), expected.item<float>(), 1e-6f);
}

TEST_F(ColorLossTest, AvgPoolDownscalesChroma) {
    ColorLossParameters params;
    params.criterion = Criterion::L2;
    params.avgpool = true;
    params.scale = 4;
    auto loss = ColorLoss::create(params);
    ASSERT_TRUE(loss.has_value());

    auto result = loss->forward(input, target);
    ASSERT_TRUE(result.has_value());

    namespace F = torch::nn::functional;
    const auto a = F::avg_pool2d(rgb_to_cbcr(input), F::AvgPool2dFuncOptions(4));
    const auto b = F::avg_pool2d(rgb_to_cbcr(target), F::AvgPool2dFuncOptions(4));
    EXPECT_NEAR(result->item<float>(), (a - b).pow(2).mean().item<float>(), 1e-6f);
}

TEST_F(ColorLossTest, RejectsInvalidInput) {
    ColorLossParameters params;
    params.criterion = Criterion::Fro;
    EXPECT_FALSE(ColorLoss::create(params).has_value());

    auto loss = ColorLoss::create({});
    ASSERT_TRUE(loss.has_value());
    const auto gray = torch::rand({1, 1, 4, 4});
    EXPECT_FALSE(loss->forward(gray, gray).has_value());
    EXPECT_FALSE(loss->forward(input, torch::rand({2, 3, 8, 4})).has_value());
}

TEST_F(ColorLossTest, AverageLossComparesDownscaledImages) {
    AverageLossParameters params;
    params.scale = 2;
    params.loss_weight = 0.5f;
    auto loss = AverageLoss::create(params);
    ASSERT_TRUE(loss.has_value());

    auto result = loss->forward(input, target);
    ASSERT_TRUE(result.has_value()) << result.error();

    namespace F = torch::nn::functional;
    const auto a = F::avg_pool2d(input, F::AvgPool2dFuncOptions(2));
    const auto b = F::avg_pool2d(target, F::AvgPool2dFuncOptions(2));
    EXPECT_NEAR(result->item<float>(), 0.5f * (a - b).abs().mean().item<float>(), 1e-6f);
}

TEST_F(ColorLossTest, AverageLossIgnoresDetailBelowScale) {
    // A zero-mean checkerboard vanishes under 2x2 averaging
    auto checker = torch::tensor({1.0f, -1.0f, -1.0f, 1.0f}).view({1, 1, 2, 2}).repeat({1, 3, 4, 4}) * 0.1f;
    const auto base = input.index({torch::indexing::Slice(0, 1)});

    AverageLossParameters params;
    params.scale = 2;
    auto loss = AverageLoss::create(params);
    ASSERT_TRUE(loss.has_value());

    auto result = loss->forward(base, base + checker);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->item<float>(), 0.0f, 1e-6f);
}

TEST_F(ColorLossTest, AverageLossRejectsUnsupportedCriterion) {
    AverageLossParameters params;
    params.criterion = Criterion::Huber;
    EXPECT_FALSE(AverageLoss::create(params).has_value());

    params.criterion = Criterion::L2;
    params.scale = 0;
    EXPECT_FALSE(AverageLoss::create(params).has_value());
}
