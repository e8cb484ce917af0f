/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>
#include <torch/torch.h>

namespace srl::losses::contextual {

    /**
     * @brief Split [N, C, H, W] into its four spatial quadrants stacked on the batch axis
     *
     * Split points are round(H / 2) and round(W / 2). Odd sizes would give
     * quadrants of unequal size and throw c10::Error. Output order is top-left,
     * top-right, bottom-left, bottom-right; output batch is 4 * N.
     */
    torch::Tensor crop_quarters(const torch::Tensor& features);

    /**
     * @brief Draw @p n distinct positions of a flattened grid of @p spatial_size
     * @param generator Random source; the process-wide default when empty
     * @return int64 positions [n] on the CPU
     */
    torch::Tensor sample_indices(int64_t spatial_size, int64_t n,
                                 std::optional<at::Generator> generator = std::nullopt);

    /**
     * @brief Gather positions of the flattened spatial grid
     * @param features [N, C, H, W]
     * @param indices int64 positions [n] into the H*W grid
     * @return [N, C, n] gathered features on the device of @p features
     */
    torch::Tensor gather_positions(const torch::Tensor& features, const torch::Tensor& indices);

    struct PooledGroup {
        std::vector<torch::Tensor> features; ///< [N, C, size, size] per input, input order
        torch::Tensor indices;               ///< [size * size] positions shared by the group
    };

    /**
     * @brief Random spatial pooling of a group of equally shaped feature maps
     *
     * Draws output_1d_size^2 positions once (or takes @p indices when defined)
     * and applies the same positions to every tensor of the group, so that
     * paired maps keep their spatial correspondence.
     */
    std::expected<PooledGroup, std::string> random_pooling(const std::vector<torch::Tensor>& group,
                                                           int64_t output_1d_size,
                                                           std::optional<at::Generator> generator = std::nullopt,
                                                           const torch::Tensor& indices = {});

} // namespace srl::losses::contextual
