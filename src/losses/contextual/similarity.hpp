/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include "distance.hpp"
#include <expected>
#include <string>
#include <torch/torch.h>

namespace srl::losses::contextual {

    using core::param::CalcType;

    inline constexpr double AGGREGATION_EPSILON = 1e-5;

    struct LayerLossParams {
        DistanceType distance_type = DistanceType::Cosine;
        float b = 1.0f;
        float band_width = 0.5f;
        float spatial_weight = 0.1f;
        float loss_weight = 1.0f;
    };

    /// exp((b - d) / h), Eq. (3)
    torch::Tensor exp_similarity(const torch::Tensor& relative, float b, float band_width);

    /// Normalize rows (last axis) to sum to one, Eq. (4)
    torch::Tensor normalize_rows(const torch::Tensor& similarity);

    /// Row-normalized contextual similarity of a relative distance tensor
    torch::Tensor contextual_similarity(const torch::Tensor& relative, float b, float band_width);

    /**
     * @brief Reduce a similarity tensor [N, H, W, S] to the scalar loss
     *
     * Best match per query position (max over the last axis), averaged over
     * spatial positions and batch, then -log(mean + 1e-5).
     */
    torch::Tensor aggregate(const torch::Tensor& similarity);

    /**
     * @brief Normalized coordinate grid [N, 2, H, W]
     *
     * Channel 0 holds row / (H + 1), channel 1 holds col / (W + 1).
     */
    torch::Tensor coordinate_grid(int64_t N, int64_t H, int64_t W, const torch::TensorOptions& options);

    /// Contextual loss of I against T, multiplied by loss_weight
    std::expected<torch::Tensor, std::string> regular_loss(const torch::Tensor& I, const torch::Tensor& T,
                                                           const LayerLossParams& params);

    /// Mean of regular_loss(I, T) and regular_loss(T, I)
    std::expected<torch::Tensor, std::string> symmetric_loss(const torch::Tensor& I, const torch::Tensor& T,
                                                             const LayerLossParams& params);

    /// Feature similarity blended with spatial-grid similarity by spatial_weight
    std::expected<torch::Tensor, std::string> bilateral_loss(const torch::Tensor& I, const torch::Tensor& T,
                                                             const LayerLossParams& params);

    /// Dispatch to the variant selected by @p type
    std::expected<torch::Tensor, std::string> layer_loss(CalcType type,
                                                         const torch::Tensor& I, const torch::Tensor& T,
                                                         const LayerLossParams& params);

} // namespace srl::losses::contextual
