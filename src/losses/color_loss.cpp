/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "color_loss.hpp"
#include "core/logger.hpp"
#include "numerics.hpp"
#include "pixel_loss.hpp"
#include <format>

namespace srl::losses {

    namespace F = torch::nn::functional;

    namespace {
        constexpr double CHROMA_DELTA = 0.5;

        std::expected<void, std::string> check_pair(const char* name, const torch::Tensor& a, const torch::Tensor& b) {
            if (a.sizes() != b.sizes()) {
                LOG_ERROR("{} shape mismatch: {} vs {}", name, shape_string(a), shape_string(b));
                return std::unexpected(std::format("{} shape mismatch: {} vs {}", name, shape_string(a), shape_string(b)));
            }
            if (a.dim() != 4) {
                LOG_ERROR("{} expects [N, C, H, W], got {}", name, shape_string(a));
                return std::unexpected(std::format("{} expects [N, C, H, W], got {}", name, shape_string(a)));
            }
            return {};
        }

        torch::Tensor downscale(const torch::Tensor& x, const int scale) {
            return F::avg_pool2d(x, F::AvgPool2dFuncOptions(scale));
        }
    } // namespace

    torch::Tensor rgb_to_cbcr(const torch::Tensor& rgb) {
        const auto r = rgb.select(1, 0);
        const auto g = rgb.select(1, 1);
        const auto b = rgb.select(1, 2);

        const auto y = 0.299 * r + 0.587 * g + 0.114 * b;
        const auto cb = (b - y) * 0.564 + CHROMA_DELTA;
        const auto cr = (r - y) * 0.713 + CHROMA_DELTA;
        return torch::stack({cb, cr}, 1);
    }

    std::expected<ColorLoss, std::string> ColorLoss::create(const Params& params) {
        if (auto valid = params.validate(); !valid) {
            LOG_ERROR("Invalid color loss configuration: {}", valid.error());
            return std::unexpected(valid.error());
        }
        return ColorLoss(params);
    }

    std::expected<torch::Tensor, std::string> ColorLoss::forward(const torch::Tensor& input,
                                                                 const torch::Tensor& target) const {
        if (auto r = check_pair("ColorLoss", input, target); !r) {
            return std::unexpected(r.error());
        }
        if (input.size(1) != 3) {
            LOG_ERROR("ColorLoss expects RGB input, got {} channels", input.size(1));
            return std::unexpected(std::format("ColorLoss expects 3 channels, got {}", input.size(1)));
        }

        try {
            auto input_uv = rgb_to_cbcr(input);
            auto target_uv = rgb_to_cbcr(target);
            if (params_.avgpool) {
                input_uv = downscale(input_uv, params_.scale);
                target_uv = downscale(target_uv, params_.scale);
            }
            return criterion_loss(params_.criterion, input_uv, target_uv) * params_.loss_weight;
        } catch (const std::exception& e) {
            LOG_ERROR("Error computing color loss: {}", e.what());
            return std::unexpected(std::format("Error computing color loss: {}", e.what()));
        }
    }

    std::expected<AverageLoss, std::string> AverageLoss::create(const Params& params) {
        if (auto valid = params.validate(); !valid) {
            LOG_ERROR("Invalid average loss configuration: {}", valid.error());
            return std::unexpected(valid.error());
        }
        return AverageLoss(params);
    }

    std::expected<torch::Tensor, std::string> AverageLoss::forward(const torch::Tensor& x,
                                                                   const torch::Tensor& y) const {
        if (auto r = check_pair("AverageLoss", x, y); !r) {
            return std::unexpected(r.error());
        }

        try {
            return criterion_loss(params_.criterion, downscale(x, params_.scale), downscale(y, params_.scale)) *
                   params_.loss_weight;
        } catch (const std::exception& e) {
            LOG_ERROR("Error computing average loss: {}", e.what());
            return std::unexpected(std::format("Error computing average loss: {}", e.what()));
        }
    }

} // namespace srl::losses
