/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include "features/feature_extractor.hpp"
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <torch/torch.h>

namespace srl::losses {

    /**
     * @brief Perceptual and style loss over pretrained network features
     *
     * The perceptual term compares feature maps layer by layer; the style term
     * compares their Gram matrices. A term whose weight is zero is not computed.
     */
    class PerceptualLoss {
    public:
        using Params = core::param::PerceptualLossParameters;

        struct Result {
            std::optional<torch::Tensor> perceptual;
            std::optional<torch::Tensor> style;
        };

        static std::expected<PerceptualLoss, std::string> create(
            const Params& params,
            std::shared_ptr<features::IFeatureExtractor> extractor);

        /**
         * @param x [N, 3, H, W] prediction
         * @param gt [N, 3, H, W] ground truth, detached before extraction
         */
        std::expected<Result, std::string> forward(const torch::Tensor& x, const torch::Tensor& gt);

        /// [N, C, H, W] -> [N, C, C] normalized by C * H * W
        static torch::Tensor gram_matrix(const torch::Tensor& features);

        const Params& params() const { return params_; }

    private:
        PerceptualLoss(Params params, std::shared_ptr<features::IFeatureExtractor> extractor);

        Params params_;
        std::shared_ptr<features::IFeatureExtractor> extractor_;
        std::vector<std::string> layers_;
    };

} // namespace srl::losses
