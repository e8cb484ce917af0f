/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "similarity.hpp"
#include "core/logger.hpp"
#include "losses/numerics.hpp"
#include <format>
#include <string_view>

namespace srl::losses::contextual {

    namespace {
        // Names of the query and target maps as the caller knows them
        struct Roles {
            std::string_view query = "I_features";
            std::string_view target = "T_features";
        };

        // Feature similarity with degeneracy checks after every stage
        std::expected<torch::Tensor, std::string> feature_similarity(const torch::Tensor& I,
                                                                     const torch::Tensor& T,
                                                                     const LayerLossParams& params,
                                                                     const Roles roles = {}) {
            if (auto r = check_not_degenerate(I, roles.query); !r) return std::unexpected(r.error());
            if (auto r = check_not_degenerate(T, roles.target); !r) return std::unexpected(r.error());

            auto raw = raw_distance(I, T, params.distance_type);
            if (!raw) {
                return std::unexpected(raw.error());
            }
            if (auto r = check_not_degenerate(*raw, "raw_distance"); !r) return std::unexpected(r.error());

            const auto relative = relative_distance(*raw);
            if (auto r = check_not_degenerate(relative, "relative_distance"); !r) return std::unexpected(r.error());

            const auto exp_distance = exp_similarity(relative, params.b, params.band_width);
            if (auto r = check_not_degenerate(exp_distance, "exp_distance"); !r) return std::unexpected(r.error());

            auto similarity = normalize_rows(exp_distance);
            if (auto r = check_not_degenerate(similarity, "contextual_sim"); !r) return std::unexpected(r.error());

            return similarity;
        }

        std::expected<torch::Tensor, std::string> finish(const torch::Tensor& similarity, const float loss_weight) {
            auto loss = aggregate(similarity) * loss_weight;
            if (torch::isnan(loss).item<bool>()) {
                LOG_ERROR("NaN in computing CX loss");
                return std::unexpected("NaN in computing CX loss");
            }
            return loss;
        }

        std::expected<torch::Tensor, std::string> directed_loss(const torch::Tensor& I, const torch::Tensor& T,
                                                                const LayerLossParams& params, const Roles roles) {
            auto similarity = feature_similarity(I, T.to(I.device()), params, roles);
            if (!similarity) {
                return std::unexpected(similarity.error());
            }
            return finish(*similarity, params.loss_weight);
        }
    } // namespace

    torch::Tensor exp_similarity(const torch::Tensor& relative, const float b, const float band_width) {
        return torch::exp((b - relative) / band_width);
    }

    torch::Tensor normalize_rows(const torch::Tensor& similarity) {
        return similarity / similarity.sum(/*dim=*/-1, /*keepdim=*/true);
    }

    torch::Tensor contextual_similarity(const torch::Tensor& relative, const float b, const float band_width) {
        return normalize_rows(exp_similarity(relative, b, band_width));
    }

    torch::Tensor aggregate(const torch::Tensor& similarity) {
        const auto best_match = std::get<0>(similarity.max(/*dim=*/-1)); // [N, H, W]
        const auto cs = best_match.mean({1, 2}).mean();
        return -torch::log(cs + AGGREGATION_EPSILON); // Eq. (5)
    }

    torch::Tensor coordinate_grid(const int64_t N, const int64_t H, const int64_t W,
                                  const torch::TensorOptions& options) {
        const auto float_options = options.dtype(torch::kFloat32);
        const auto rows = torch::arange(H, float_options) / static_cast<double>(H + 1);
        const auto cols = torch::arange(W, float_options) / static_cast<double>(W + 1);
        const auto grids = torch::meshgrid({rows, cols}, /*indexing=*/"ij");
        return torch::stack({grids[0], grids[1]}, /*dim=*/0).unsqueeze(0).expand({N, 2, H, W}).contiguous();
    }

    std::expected<torch::Tensor, std::string> regular_loss(const torch::Tensor& I, const torch::Tensor& T,
                                                           const LayerLossParams& params) {
        return directed_loss(I, T, params, {});
    }

    std::expected<torch::Tensor, std::string> symmetric_loss(const torch::Tensor& I, const torch::Tensor& T,
                                                             const LayerLossParams& params) {
        // T queries I here, so the roles swap in error messages
        auto backward = directed_loss(T, I, params, {.query = "T_features", .target = "I_features"});
        if (!backward) {
            return backward;
        }
        auto forward = regular_loss(I, T, params);
        if (!forward) {
            return forward;
        }
        return (*backward + *forward) / 2;
    }

    std::expected<torch::Tensor, std::string> bilateral_loss(const torch::Tensor& I, const torch::Tensor& T,
                                                             const LayerLossParams& params) {
        const auto grid = coordinate_grid(I.size(0), I.size(2), I.size(3), I.options());
        const auto spatial = contextual_similarity(relative_distance(l2_distance(grid, grid)),
                                                   params.b, params.band_width);

        auto feature = feature_similarity(I, T.to(I.device()), params);
        if (!feature) {
            return std::unexpected(feature.error());
        }

        const auto combined = (1.0f - params.spatial_weight) * (*feature) + params.spatial_weight * spatial;
        return finish(combined, params.loss_weight);
    }

    std::expected<torch::Tensor, std::string> layer_loss(const CalcType type,
                                                         const torch::Tensor& I, const torch::Tensor& T,
                                                         const LayerLossParams& params) {
        switch (type) {
        case CalcType::Regular: return regular_loss(I, T, params);
        case CalcType::Symmetric: return symmetric_loss(I, T, params);
        case CalcType::Bilateral: return bilateral_loss(I, T, params);
        }
        return std::unexpected(std::format("Unsupported calc type {}", static_cast<int>(type)));
    }

} // namespace srl::losses::contextual
