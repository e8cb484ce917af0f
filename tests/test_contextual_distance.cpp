/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "losses/contextual/distance.hpp"
#include "losses/contextual/similarity.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <torch/torch.h>

using namespace srl::losses::contextual;

namespace {

    // Compare tensors with tolerance
    bool tensors_close(const torch::Tensor& a, const torch::Tensor& b, double rtol = 1e-4, double atol = 1e-5) {
        return a.sizes() == b.sizes() && torch::allclose(a, b, rtol, atol);
    }

    // Reference distance by explicit loops over query position (i, j) and target position k
    template <typename PairDistance>
    torch::Tensor reference_distance(const torch::Tensor& I, const torch::Tensor& T, PairDistance&& pair) {
        const auto N = I.size(0), H = I.size(2), W = I.size(3);
        auto out = torch::zeros({N, H, W, H * W});
        for (int64_t n = 0; n < N; ++n) {
            for (int64_t i = 0; i < H; ++i) {
                for (int64_t j = 0; j < W; ++j) {
                    const auto query = I.index({n, torch::indexing::Slice(), i, j});
                    for (int64_t k = 0; k < H * W; ++k) {
                        const auto target = T.index({n, torch::indexing::Slice(), k / W, k % W});
                        out.index_put_({n, i, j, k}, pair(query, target));
                    }
                }
            }
        }
        return out;
    }

    class ContextualDistanceTest : public ::testing::Test {
    protected:
        void SetUp() override {
            torch::manual_seed(42);
            I = torch::randn({2, 4, 3, 5});
            T = torch::randn({2, 4, 3, 5});
        }

        torch::Tensor I;
        torch::Tensor T;
    };

} // namespace

TEST_F(ContextualDistanceTest, L2MatchesSquaredEuclidean) {
    const auto dist = l2_distance(I, T);
    const auto expected = reference_distance(I, T, [](const auto& a, const auto& b) {
        return (a - b).pow(2).sum();
    });

    EXPECT_EQ(dist.sizes(), (std::vector<int64_t>{2, 3, 5, 15}));
    EXPECT_TRUE(tensors_close(dist, expected, 1e-4, 1e-4));
    EXPECT_GE(dist.min().item<float>(), 0.0f);
}

TEST_F(ContextualDistanceTest, L1MatchesManhattan) {
    const auto dist = l1_distance(I, T);
    const auto expected = reference_distance(I, T, [](const auto& a, const auto& b) {
        return (a - b).abs().sum();
    });

    EXPECT_EQ(dist.sizes(), (std::vector<int64_t>{2, 3, 5, 15}));
    EXPECT_TRUE(tensors_close(dist, expected, 1e-4, 1e-4));
}

TEST_F(ContextualDistanceTest, CosineCentersOnTargetMean) {
    const auto dist = cosine_distance(I, T);

    const auto mean_T = T.mean({0, 2, 3}, true);
    const auto Ic = I - mean_T;
    const auto Tc = T - mean_T;
    const auto expected = reference_distance(Ic, Tc, [](const auto& a, const auto& b) {
        const auto cos = (a * b).sum() / (a.norm() * b.norm());
        return ((1 - cos) / 2).clamp_min(0.0);
    });

    EXPECT_TRUE(tensors_close(dist, expected, 1e-4, 1e-5));
    EXPECT_GE(dist.min().item<float>(), 0.0f);
    EXPECT_LE(dist.max().item<float>(), 1.0f + 1e-6f);
}

TEST_F(ContextualDistanceTest, IdenticalInputsHaveZeroDiagonal) {
    for (auto type : {DistanceType::L1, DistanceType::L2, DistanceType::Cosine}) {
        auto dist = raw_distance(I, I, type);
        ASSERT_TRUE(dist.has_value()) << dist.error();

        const auto flat = dist->reshape({2, 15, 15});
        const auto diagonal = flat.diagonal(0, 1, 2);
        EXPECT_LT(diagonal.abs().max().item<float>(), 1e-4f) << "type " << static_cast<int>(type);
    }
}

TEST_F(ContextualDistanceTest, RawDistanceRejectsShapeMismatch) {
    const auto other = torch::randn({2, 5, 3, 5});
    auto dist = raw_distance(I, other, DistanceType::L2);
    ASSERT_FALSE(dist.has_value());
    EXPECT_NE(dist.error().find("mismatch"), std::string::npos);
}

TEST_F(ContextualDistanceTest, RelativeDistanceDividesByRowMinimum) {
    const auto raw = l1_distance(I, T);
    const auto relative = relative_distance(raw);

    const auto row_min = std::get<0>(raw.min(-1, true));
    EXPECT_TRUE(tensors_close(relative * (row_min + RELATIVE_DISTANCE_EPSILON), raw));

    // Every row's minimum maps to just under 1
    const auto relative_min = std::get<0>(relative.min(-1));
    EXPECT_LE(relative_min.max().item<float>(), 1.0f);
    EXPECT_GT(relative_min.min().item<float>(), 0.99f);
}

TEST_F(ContextualDistanceTest, RelativeDistanceOfKnownRow) {
    const auto raw = torch::tensor({2.0f, 4.0f, 8.0f}).view({1, 1, 1, 3});
    const auto relative = relative_distance(raw);

    const double denominator = 2.0 + RELATIVE_DISTANCE_EPSILON;
    EXPECT_NEAR(relative.index({0, 0, 0, 0}).item<double>(), 2.0 / denominator, 1e-6);
    EXPECT_NEAR(relative.index({0, 0, 0, 1}).item<double>(), 4.0 / denominator, 1e-6);
    EXPECT_NEAR(relative.index({0, 0, 0, 2}).item<double>(), 8.0 / denominator, 1e-6);
}

TEST_F(ContextualDistanceTest, SimilarityRowsSumToOne) {
    const auto relative = relative_distance(l2_distance(I, T));
    for (float band_width : {0.05f, 0.5f, 2.0f, 10.0f}) {
        const auto cx = contextual_similarity(relative, 1.0f, band_width);

        const auto row_sums = cx.sum(-1);
        EXPECT_TRUE(tensors_close(row_sums, torch::ones_like(row_sums), 1e-5, 1e-5)) << "band_width " << band_width;
        EXPECT_GE(cx.min().item<float>(), 0.0f);
    }
}

TEST_F(ContextualDistanceTest, ExpSimilarityFormula) {
    const auto relative = torch::rand({1, 2, 2, 4}) * 3;
    const auto w = exp_similarity(relative, 1.0f, 0.5f);
    EXPECT_TRUE(tensors_close(w, torch::exp((1.0 - relative) / 0.5)));
}

TEST_F(ContextualDistanceTest, AggregateTakesBestMatchPerQuery) {
    // One sample, 1x2 queries over 2 targets
    const auto cx = torch::tensor({0.9f, 0.1f, 0.3f, 0.7f}).view({1, 1, 2, 2});
    const auto loss = aggregate(cx);
    const double expected = -std::log((0.9 + 0.7) / 2.0 + AGGREGATION_EPSILON);
    EXPECT_NEAR(loss.item<double>(), expected, 1e-6);
}

TEST_F(ContextualDistanceTest, CoordinateGridNormalizedPositions) {
    const auto grid = coordinate_grid(2, 3, 4, torch::TensorOptions());
    EXPECT_EQ(grid.sizes(), (std::vector<int64_t>{2, 2, 3, 4}));
    EXPECT_EQ(grid.scalar_type(), torch::kFloat32);

    EXPECT_FLOAT_EQ(grid.index({0, 0, 2, 1}).item<float>(), 2.0f / 4.0f);
    EXPECT_FLOAT_EQ(grid.index({1, 1, 2, 3}).item<float>(), 3.0f / 5.0f);
    EXPECT_FLOAT_EQ(grid.index({0, 0, 0, 0}).item<float>(), 0.0f);
}
