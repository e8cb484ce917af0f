/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "features/torchscript_extractor.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <torch/script.h>
#include <torch/torch.h>

using namespace srl::features;

namespace {

    class TorchScriptExtractorTest : public ::testing::Test {
    protected:
        void SetUp() override {
            torch::manual_seed(42);
            model_path = std::filesystem::temp_directory_path() / "srl_fake_vgg.pt";

            // Two "layers": identity and a 2x average pool
            torch::jit::Module module("FakeVgg");
            module.define(R"(
def forward(self, x):
    return {"conv1_1": x, "conv2_1": torch.avg_pool2d(x, [2, 2])}
)");
            module.save(model_path.string());
        }

        void TearDown() override {
            std::error_code ec;
            std::filesystem::remove(model_path, ec);
        }

        std::filesystem::path model_path;
    };

} // namespace

TEST_F(TorchScriptExtractorTest, ExtractsRequestedLayers) {
    auto extractor = TorchScriptFeatureExtractor::load(model_path, {.use_input_norm = false});
    ASSERT_TRUE(extractor.has_value()) << extractor.error();

    const auto image = torch::rand({2, 3, 8, 8});
    auto features = (*extractor)->extract(image, {"conv2_1"});
    ASSERT_TRUE(features.has_value()) << features.error();
    ASSERT_EQ(features->count("conv2_1"), 1u);
    EXPECT_EQ(features->at("conv2_1").sizes(), (std::vector<int64_t>{2, 3, 4, 4}));
}

TEST_F(TorchScriptExtractorTest, AppliesImageNetNormalization) {
    auto extractor = TorchScriptFeatureExtractor::load(model_path, {.use_input_norm = true, .range_norm = true});
    ASSERT_TRUE(extractor.has_value());

    // -1 maps to 0 under range normalization, then (0 - mean) / std
    const auto image = torch::full({1, 3, 2, 2}, -1.0f);
    auto features = (*extractor)->extract(image, {"conv1_1"});
    ASSERT_TRUE(features.has_value());

    const auto& f = features->at("conv1_1");
    EXPECT_NEAR(f.index({0, 0, 0, 0}).item<float>(), -0.485f / 0.229f, 1e-5f);
    EXPECT_NEAR(f.index({0, 2, 1, 1}).item<float>(), -0.406f / 0.225f, 1e-5f);
}

TEST_F(TorchScriptExtractorTest, GradientFlowsThroughFrozenModule) {
    auto extractor = TorchScriptFeatureExtractor::load(model_path, {});
    ASSERT_TRUE(extractor.has_value());

    auto image = torch::rand({1, 3, 4, 4}, torch::requires_grad());
    auto features = (*extractor)->extract(image, {"conv2_1"});
    ASSERT_TRUE(features.has_value());

    features->at("conv2_1").sum().backward();
    ASSERT_TRUE(image.grad().defined());
}

TEST_F(TorchScriptExtractorTest, ReportsErrors) {
    EXPECT_FALSE(TorchScriptFeatureExtractor::load(model_path.parent_path() / "no_such_model.pt", {}).has_value());

    auto extractor = TorchScriptFeatureExtractor::load(model_path, {});
    ASSERT_TRUE(extractor.has_value());

    auto missing = (*extractor)->extract(torch::rand({1, 3, 4, 4}), {"conv5_4"});
    ASSERT_FALSE(missing.has_value());
    EXPECT_NE(missing.error().find("conv5_4"), std::string::npos);

    EXPECT_FALSE((*extractor)->extract(torch::rand({1, 1, 4, 4}), {"conv1_1"}).has_value());
}

TEST_F(TorchScriptExtractorTest, OptionsFollowLossConfiguration) {
    srl::core::param::ContextualLossParameters contextual;
    contextual.z_norm = true;
    contextual.net = "vgg16";
    const auto cx_options = extractor_options(contextual);
    EXPECT_EQ(cx_options.net, "vgg16");
    EXPECT_TRUE(cx_options.use_input_norm);
    EXPECT_TRUE(cx_options.range_norm);

    srl::core::param::PerceptualLossParameters perceptual;
    perceptual.range_norm = true;
    perceptual.use_input_norm = false;
    const auto p_options = extractor_options(perceptual);
    EXPECT_EQ(p_options.net, "vgg19");
    EXPECT_FALSE(p_options.use_input_norm);
    EXPECT_TRUE(p_options.range_norm);
}
