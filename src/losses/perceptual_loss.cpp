/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "perceptual_loss.hpp"
#include "core/logger.hpp"
#include "numerics.hpp"
#include "pixel_loss.hpp"
#include <format>

namespace srl::losses {

    PerceptualLoss::PerceptualLoss(Params params, std::shared_ptr<features::IFeatureExtractor> extractor)
        : params_(std::move(params)),
          extractor_(std::move(extractor)) {
        layers_.reserve(params_.layer_weights.size());
        for (const auto& [layer, weight] : params_.layer_weights) {
            layers_.push_back(layer);
        }
    }

    std::expected<PerceptualLoss, std::string> PerceptualLoss::create(
        const Params& params,
        std::shared_ptr<features::IFeatureExtractor> extractor) {

        if (auto valid = params.validate(); !valid) {
            LOG_ERROR("Invalid perceptual loss configuration: {}", valid.error());
            return std::unexpected(valid.error());
        }
        if (!extractor) {
            LOG_ERROR("Perceptual loss requires a feature extractor");
            return std::unexpected("Perceptual loss requires a feature extractor");
        }

        LOG_DEBUG("Perceptual loss: {} layers on {}, criterion={}, perceptual_weight={}, style_weight={}",
                  params.layer_weights.size(), extractor->name(), core::param::to_string(params.criterion),
                  params.perceptual_weight, params.style_weight);
        return PerceptualLoss(params, std::move(extractor));
    }

    torch::Tensor PerceptualLoss::gram_matrix(const torch::Tensor& features) {
        const auto n = features.size(0);
        const auto c = features.size(1);
        const auto h = features.size(2);
        const auto w = features.size(3);
        const auto flat = features.view({n, c, h * w});
        return torch::bmm(flat, flat.transpose(1, 2)) / static_cast<double>(c * h * w);
    }

    std::expected<PerceptualLoss::Result, std::string> PerceptualLoss::forward(const torch::Tensor& x,
                                                                               const torch::Tensor& gt) {
        if (x.sizes() != gt.sizes()) {
            LOG_ERROR("Perceptual loss shape mismatch: {} vs {}", shape_string(x), shape_string(gt));
            return std::unexpected(std::format("Shape mismatch: x {} vs gt {}", shape_string(x), shape_string(gt)));
        }

        try {
            auto x_features = extractor_->extract(x, layers_);
            if (!x_features) {
                return std::unexpected(x_features.error());
            }
            auto gt_features = extractor_->extract(gt.detach(), layers_);
            if (!gt_features) {
                return std::unexpected(gt_features.error());
            }

            Result result;

            if (params_.perceptual_weight > 0.0f) {
                auto loss = torch::zeros({}, x.options());
                for (const auto& [layer, weight] : params_.layer_weights) {
                    const auto& fx = x_features->at(layer);
                    const auto& fgt = gt_features->at(layer);
                    loss = loss + criterion_loss(params_.criterion, fx, fgt.to(fx.device())).to(x.device()) * weight;
                }
                result.perceptual = loss * params_.perceptual_weight;
            }

            if (params_.style_weight > 0.0f) {
                auto loss = torch::zeros({}, x.options());
                for (const auto& [layer, weight] : params_.layer_weights) {
                    const auto& fx = x_features->at(layer);
                    const auto& fgt = gt_features->at(layer);
                    loss = loss + criterion_loss(params_.criterion, gram_matrix(fx),
                                                 gram_matrix(fgt.to(fx.device())))
                                          .to(x.device()) *
                                      weight;
                }
                result.style = loss * params_.style_weight;
            }

            return result;

        } catch (const std::exception& e) {
            LOG_ERROR("Error computing perceptual loss: {}", e.what());
            return std::unexpected(std::format("Error computing perceptual loss: {}", e.what()));
        }
    }

} // namespace srl::losses
