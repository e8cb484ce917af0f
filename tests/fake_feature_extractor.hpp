/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "features/feature_extractor.hpp"
#include <format>
#include <torch/torch.h>

namespace srl::test {

    /**
     * Deterministic, differentiable stand-in for a pretrained network.
     *
     *   conv3_2: [x, x^2]           (6 channels, full resolution)
     *   conv4_2: avg_pool2d(x, 2)   (3 channels, half resolution)
     *   conv5_4: avg_pool2d(x, 4)   (3 channels, quarter resolution)
     */
    class FakeFeatureExtractor : public features::IFeatureExtractor {
    public:
        std::expected<features::FeatureMapDict, std::string>
            extract(const torch::Tensor& image, const std::vector<std::string>& layers) override {
            ++calls;
            if (image.dim() != 4 || image.size(1) != 3) {
                return std::unexpected("fake extractor expects [N, 3, H, W]");
            }

            namespace F = torch::nn::functional;
            features::FeatureMapDict out;
            for (const auto& layer : layers) {
                if (layer == "conv3_2") {
                    out.emplace(layer, torch::cat({image, image * image}, 1));
                } else if (layer == "conv4_2") {
                    out.emplace(layer, F::avg_pool2d(image, F::AvgPool2dFuncOptions(2)));
                } else if (layer == "conv5_4") {
                    out.emplace(layer, F::avg_pool2d(image, F::AvgPool2dFuncOptions(4)));
                } else {
                    return std::unexpected(std::format("Layer '{}' not produced by feature extractor", layer));
                }
            }
            return out;
        }

        std::string name() const override { return "fake"; }

        int calls = 0;
    };

} // namespace srl::test
