/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "sampling.hpp"
#include "core/logger.hpp"
#include "losses/numerics.hpp"
#include <cmath>
#include <format>

namespace srl::losses::contextual {

    using torch::indexing::Slice;

    torch::Tensor crop_quarters(const torch::Tensor& features) {
        TORCH_CHECK(features.dim() == 4, "crop_quarters expects [N, C, H, W], got ", features.dim(), " dims");
        const auto H = features.size(2);
        const auto W = features.size(3);

        // std::lrint rounds half to even under the default rounding mode
        const int64_t h = std::lrint(static_cast<double>(H) / 2.0);
        const int64_t w = std::lrint(static_cast<double>(W) / 2.0);
        TORCH_CHECK(2 * h == H && 2 * w == W,
                    "crop_quarters needs even spatial sizes to stack quadrants, got ", H, "x", W);

        return torch::cat({features.index({"...", Slice(0, h), Slice(0, w)}),
                           features.index({"...", Slice(0, h), Slice(w, torch::indexing::None)}),
                           features.index({"...", Slice(h, torch::indexing::None), Slice(0, w)}),
                           features.index({"...", Slice(h, torch::indexing::None), Slice(w, torch::indexing::None)})},
                          /*dim=*/0);
    }

    torch::Tensor sample_indices(const int64_t spatial_size, const int64_t n,
                                 std::optional<at::Generator> generator) {
        TORCH_CHECK(n <= spatial_size, "cannot sample ", n, " positions out of ", spatial_size);
        const auto perm = torch::randperm(spatial_size, generator, torch::TensorOptions().dtype(torch::kLong));
        return perm.index({Slice(0, n)}).clamp_max(spatial_size - 1).contiguous();
    }

    torch::Tensor gather_positions(const torch::Tensor& features, const torch::Tensor& indices) {
        TORCH_CHECK(features.dim() == 4, "gather_positions expects [N, C, H, W], got ", features.dim(), " dims");
        const auto N = features.size(0), C = features.size(1);
        const auto S = features.size(2) * features.size(3);

        const auto flat = features.reshape({N, C, S});
        const auto index = indices.to(features.device(), torch::kLong).view({1, 1, -1}).expand({N, C, -1});
        return torch::gather(flat, /*dim=*/-1, index);
    }

    std::expected<PooledGroup, std::string> random_pooling(const std::vector<torch::Tensor>& group,
                                                           const int64_t output_1d_size,
                                                           std::optional<at::Generator> generator,
                                                           const torch::Tensor& indices) {
        if (group.empty()) {
            return std::unexpected("random_pooling needs at least one tensor");
        }

        const auto& first = group.front();
        if (first.dim() != 4) {
            return std::unexpected(std::format("random_pooling expects [N, C, H, W], got {}", shape_string(first)));
        }
        for (const auto& t : group) {
            if (t.sizes() != first.sizes()) {
                LOG_ERROR("random_pooling group shape mismatch: {} vs {}", shape_string(first), shape_string(t));
                return std::unexpected(std::format("Feature map shape mismatch: {} vs {}",
                                                   shape_string(first), shape_string(t)));
            }
        }

        const auto N = first.size(0), C = first.size(1);
        const auto S = first.size(2) * first.size(3);
        const auto n = output_1d_size * output_1d_size;
        if (n > S) {
            return std::unexpected(std::format("Cannot pool {}x{} positions from a {}x{} map",
                                               output_1d_size, output_1d_size, first.size(2), first.size(3)));
        }

        PooledGroup pooled;
        if (indices.defined()) {
            if (indices.numel() != n) {
                return std::unexpected(std::format("Expected {} sampling indices, got {}", n, indices.numel()));
            }
            pooled.indices = indices.reshape({-1});
        } else {
            pooled.indices = sample_indices(S, n, generator);
        }

        pooled.features.reserve(group.size());
        for (const auto& t : group) {
            pooled.features.push_back(
                gather_positions(t, pooled.indices).view({N, C, output_1d_size, output_1d_size}));
        }

        LOG_TRACE("Pooled {} tensors {} -> {}x{}", group.size(), shape_string(first), output_1d_size, output_1d_size);
        return pooled;
    }

} // namespace srl::losses::contextual
