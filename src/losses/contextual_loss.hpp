/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "contextual/similarity.hpp"
#include "core/parameters.hpp"
#include "features/feature_extractor.hpp"
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <torch/torch.h>

namespace srl::losses {

    /**
     * @brief Contextual loss (CX) between unaligned images
     *
     * Mechrez et al., "The Contextual Loss for Image Transformation with
     * Non-Aligned Data", ECCV 2018.
     *
     * Per configured feature layer:
     *   features -> [crop quarters] -> [random pooling] -> distance -> relative
     *   distance -> similarity -> aggregate, weighted by the layer weight and summed.
     *
     * Without an extractor (use_vgg = false) the pipeline runs on the raw images;
     * that mode works but its results are not known to be useful for training.
     *
     * Sampling uses the process-wide LibTorch generator unless Params::seed is set.
     */
    class ContextualLoss {
    public:
        using Params = core::param::ContextualLossParameters;

        /**
         * @brief Validate the configuration and build the loss
         * @param params Loss configuration
         * @param extractor Feature extractor, required when params.use_vgg is set
         * @return Loss or configuration error
         */
        static std::expected<ContextualLoss, std::string> create(
            const Params& params,
            std::shared_ptr<features::IFeatureExtractor> extractor = nullptr);

        /**
         * @brief Compute the loss of @p prediction against @p target
         * @param prediction [N, C, H, W], C = 3 in extractor mode
         * @param target Same shape as prediction
         * @return 0-dim loss tensor differentiable w.r.t. prediction, or error
         */
        std::expected<torch::Tensor, std::string> forward(const torch::Tensor& prediction,
                                                          const torch::Tensor& target);

        /// Single-layer loss through the configured calculation variant
        std::expected<torch::Tensor, std::string> layer_loss(const torch::Tensor& I,
                                                             const torch::Tensor& T) const;

        /// Crop quarters and pool a feature pair as configured
        std::expected<std::pair<torch::Tensor, torch::Tensor>, std::string>
            preprocess(const torch::Tensor& I, const torch::Tensor& T) const;

        const Params& params() const { return params_; }
        const std::vector<std::string>& layers() const { return layers_; }

    private:
        ContextualLoss(Params params,
                       std::shared_ptr<features::IFeatureExtractor> extractor,
                       std::optional<at::Generator> generator);

        Params params_;
        contextual::LayerLossParams layer_params_;
        std::shared_ptr<features::IFeatureExtractor> extractor_;
        std::vector<std::string> layers_;
        std::optional<at::Generator> generator_;
    };

} // namespace srl::losses
