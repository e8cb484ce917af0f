/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "distance.hpp"
#include "core/logger.hpp"
#include "losses/numerics.hpp"
#include <format>

namespace srl::losses::contextual {

    namespace F = torch::nn::functional;

    namespace {
        void check_pair(const torch::Tensor& I, const torch::Tensor& T) {
            TORCH_CHECK(I.dim() == 4, "feature maps must be [N, C, H, W], got ", I.dim(), " dims");
            TORCH_CHECK(I.sizes() == T.sizes(), "feature map shapes differ: ", I.sizes(), " vs ", T.sizes());
        }
    } // namespace

    torch::Tensor l2_distance(const torch::Tensor& I, const torch::Tensor& T) {
        check_pair(I, T);
        const auto N = I.size(0), C = I.size(1), H = I.size(2), W = I.size(3);

        const auto Ivecs = I.reshape({N, C, H * W});
        const auto Tvecs = T.reshape({N, C, H * W});

        const auto square_I = (Ivecs * Ivecs).sum(1); // [N, S]
        const auto square_T = (Tvecs * Tvecs).sum(1); // [N, S]
        const auto AB = torch::bmm(Ivecs.transpose(1, 2), Tvecs); // [N, S, S]

        const auto dist = square_I.unsqueeze(2) + square_T.unsqueeze(1) - 2 * AB;
        return dist.reshape({N, H, W, H * W}).clamp_min(0.0);
    }

    torch::Tensor l1_distance(const torch::Tensor& I, const torch::Tensor& T) {
        check_pair(I, T);
        const auto N = I.size(0), C = I.size(1), H = I.size(2), W = I.size(3);

        // cdist avoids materializing the [N, C, S, S] difference tensor
        const auto Ivecs = I.reshape({N, C, H * W}).transpose(1, 2);
        const auto Tvecs = T.reshape({N, C, H * W}).transpose(1, 2);
        const auto dist = torch::cdist(Ivecs, Tvecs, /*p=*/1.0); // [N, S, S]

        return dist.reshape({N, H, W, H * W});
    }

    torch::Tensor cosine_distance(const torch::Tensor& I, const torch::Tensor& T) {
        check_pair(I, T);
        const auto N = I.size(0), C = I.size(1), H = I.size(2), W = I.size(3);

        const auto mean_T = T.mean({0, 2, 3}, /*keepdim=*/true);
        const auto I_norm = F::normalize(I - mean_T, F::NormalizeFuncOptions().p(2).dim(1));
        const auto T_norm = F::normalize(T - mean_T, F::NormalizeFuncOptions().p(2).dim(1));

        const auto Ivecs = I_norm.reshape({N, C, H * W}).to(torch::kFloat32);
        const auto Tvecs = T_norm.reshape({N, C, H * W}).to(torch::kFloat32);
        const auto cosine = torch::bmm(Ivecs.transpose(1, 2), Tvecs); // [N, S, S]

        const auto dist = (1 - cosine) / 2;
        return dist.reshape({N, H, W, H * W}).clamp_min(0.0);
    }

    std::expected<torch::Tensor, std::string> raw_distance(const torch::Tensor& I,
                                                           const torch::Tensor& T,
                                                           const DistanceType type) {
        if (I.dim() != 4 || I.sizes() != T.sizes()) {
            LOG_ERROR("Distance between mismatched feature maps {} and {}", shape_string(I), shape_string(T));
            return std::unexpected(std::format("Feature map shape mismatch: {} vs {}",
                                               shape_string(I), shape_string(T)));
        }

        switch (type) {
        case DistanceType::L1: return l1_distance(I, T);
        case DistanceType::L2: return l2_distance(I, T);
        case DistanceType::Cosine: return cosine_distance(I, T);
        }
        return std::unexpected(std::format("Unsupported distance type {}", static_cast<int>(type)));
    }

    torch::Tensor relative_distance(const torch::Tensor& raw, const double epsilon) {
        const auto row_min = std::get<0>(raw.min(/*dim=*/-1, /*keepdim=*/true));
        return raw / (row_min + epsilon); // Eq. (2)
    }

} // namespace srl::losses::contextual
