/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include <expected>
#include <string>
#include <torch/torch.h>

namespace srl::losses {

    using core::param::Criterion;
    using core::param::Reduction;

    /**
     * @brief Apply an optional element-wise weight, then reduce
     *
     * With a weight and Reduction::Mean the weighted sum is divided by the
     * weight sum (times C when the weight has a single channel), so masked
     * elements do not dilute the mean.
     *
     * @param loss Element-wise loss [N, C, H, W]
     * @param weight Undefined, or same rank as @p loss with 1 or C channels
     */
    std::expected<torch::Tensor, std::string> weight_reduce_loss(const torch::Tensor& loss,
                                                                 const torch::Tensor& weight,
                                                                 Reduction reduction);

    /**
     * @brief Mean-reduced distance between two tensors under @p criterion
     *
     * Fro is the Frobenius norm of the difference, Huber uses delta = 1.
     */
    torch::Tensor criterion_loss(Criterion criterion, const torch::Tensor& a, const torch::Tensor& b);

    /**
     * @brief L1 (mean absolute error) loss
     */
    struct L1Loss {
        struct Params {
            float loss_weight = 1.0f;
            Reduction reduction = Reduction::Mean;
        };

        /**
         * @param pred [N, C, H, W] prediction
         * @param target [N, C, H, W] ground truth
         * @param weight Optional element-wise weight
         */
        static std::expected<torch::Tensor, std::string> forward(const torch::Tensor& pred,
                                                                 const torch::Tensor& target,
                                                                 const Params& params,
                                                                 const torch::Tensor& weight = {});
    };

    /**
     * @brief MSE (L2) loss
     */
    struct MSELoss {
        struct Params {
            float loss_weight = 1.0f;
            Reduction reduction = Reduction::Mean;
        };

        static std::expected<torch::Tensor, std::string> forward(const torch::Tensor& pred,
                                                                 const torch::Tensor& target,
                                                                 const Params& params,
                                                                 const torch::Tensor& weight = {});
    };

    /**
     * @brief Charbonnier loss sqrt((pred - target)^2 + eps), a differentiable L1
     *
     * Lai et al., "Deep Laplacian Pyramid Networks for Fast and Accurate
     * Super-Resolution".
     */
    struct CharbonnierLoss {
        struct Params {
            float loss_weight = 1.0f;
            Reduction reduction = Reduction::Mean;
            float eps = 1e-12f;
        };

        static std::expected<torch::Tensor, std::string> forward(const torch::Tensor& pred,
                                                                 const torch::Tensor& target,
                                                                 const Params& params,
                                                                 const torch::Tensor& weight = {});
    };

    /**
     * @brief Weighted total variation: L1 between vertical and horizontal neighbours
     *
     * Only Reduction::Mean and Reduction::Sum are supported.
     */
    struct WeightedTVLoss {
        struct Params {
            float loss_weight = 1.0f;
            Reduction reduction = Reduction::Mean;
        };

        /**
         * @param pred [N, C, H, W]
         * @param weight Optional [N, C or 1, H, W]; cropped to each neighbour pair
         */
        static std::expected<torch::Tensor, std::string> forward(const torch::Tensor& pred,
                                                                 const Params& params,
                                                                 const torch::Tensor& weight = {});
    };

    /**
     * @brief Evaluate the pixel loss selected by a configuration section
     *
     * WeightedTVLoss ignores @p target.
     */
    std::expected<torch::Tensor, std::string> pixel_loss(const core::param::PixelLossParameters& params,
                                                         const torch::Tensor& pred,
                                                         const torch::Tensor& target,
                                                         const torch::Tensor& weight = {});

} // namespace srl::losses
