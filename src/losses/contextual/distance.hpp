/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include <expected>
#include <string>
#include <torch/torch.h>

namespace srl::losses::contextual {

    using core::param::DistanceType;

    inline constexpr double RELATIVE_DISTANCE_EPSILON = 1e-5;

    /**
     * Pairwise distance kernels between every spatial position of two feature maps.
     *
     * All kernels take I, T of identical shape [N, C, H, W] and return a
     * distance tensor [N, H, W, H*W]: entry (n, h, w, p) is the distance between
     * position (h, w) of I[n] and flattened position p of T[n]. Batch elements are
     * processed together with batched matrix products; no value of one batch
     * element enters another's distances.
     */

    /// Squared Euclidean distance |a|^2 + |b|^2 - 2ab, negatives clamped to zero
    torch::Tensor l2_distance(const torch::Tensor& I, const torch::Tensor& T);

    /// Sum of absolute channel differences
    torch::Tensor l1_distance(const torch::Tensor& I, const torch::Tensor& T);

    /**
     * @brief Cosine-derived distance (1 - cos) / 2, clamped to >= 0
     *
     * Both maps are centered by the channel-wise mean of T over batch and space
     * and L2-normalized along channels before correlating. The correlation is
     * evaluated in float32 whatever the input precision.
     */
    torch::Tensor cosine_distance(const torch::Tensor& I, const torch::Tensor& T);

    /// Shape-checked dispatch to the kernel selected by @p type
    std::expected<torch::Tensor, std::string> raw_distance(const torch::Tensor& I,
                                                           const torch::Tensor& T,
                                                           DistanceType type);

    /// Divide each row (last axis) by its minimum plus @p epsilon
    torch::Tensor relative_distance(const torch::Tensor& raw, double epsilon = RELATIVE_DISTANCE_EPSILON);

} // namespace srl::losses::contextual
