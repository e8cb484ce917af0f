/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "contextual_loss.hpp"
#include "contextual/sampling.hpp"
#include "core/logger.hpp"
#include "numerics.hpp"
#include <ATen/CPUGeneratorImpl.h>
#include <format>

namespace srl::losses {

    using core::param::to_string;

    ContextualLoss::ContextualLoss(Params params,
                                   std::shared_ptr<features::IFeatureExtractor> extractor,
                                   std::optional<at::Generator> generator)
        : params_(std::move(params)),
          layer_params_{.distance_type = params_.distance_type,
                        .b = params_.b,
                        .band_width = params_.band_width,
                        .spatial_weight = params_.spatial_weight,
                        .loss_weight = params_.loss_weight},
          extractor_(std::move(extractor)),
          generator_(std::move(generator)) {
        for (const auto& [layer, weight] : params_.layer_weights) {
            layers_.push_back(layer);
        }
    }

    std::expected<ContextualLoss, std::string> ContextualLoss::create(
        const Params& params,
        std::shared_ptr<features::IFeatureExtractor> extractor) {

        if (auto valid = params.validate(); !valid) {
            LOG_ERROR("Invalid contextual loss configuration: {}", valid.error());
            return std::unexpected(valid.error());
        }

        // Params built in code may still use extractor aliases such as conv_3_2
        Params normalized = params;
        normalized.layer_weights.clear();
        for (const auto& [layer, weight] : params.layer_weights) {
            const auto name = core::param::normalize_layer_name(layer);
            if (!normalized.layer_weights.emplace(name, weight).second) {
                LOG_ERROR("Contextual loss layer '{}' configured twice (as '{}')", name, layer);
                return std::unexpected(std::format("Layer '{}' configured twice", name));
            }
        }

        if (params.use_vgg && !extractor) {
            LOG_ERROR("Contextual loss configured with use_vgg but no feature extractor given");
            return std::unexpected("use_vgg requires a feature extractor");
        }
        if (!params.use_vgg) {
            LOG_WARN("Contextual loss without feature extractor runs on raw images; results are unverified");
            extractor.reset();
        }

        std::optional<at::Generator> generator;
        if (params.seed) {
            generator = at::make_generator<at::CPUGeneratorImpl>(*params.seed);
        }

        LOG_DEBUG("Contextual loss: distance={}, calc={}, b={}, h={}, max_1d_size={}, crop_quarter={}, layers={}",
                  to_string(params.distance_type), to_string(params.calc_type), params.b, params.band_width,
                  params.max_1d_size, params.crop_quarter, normalized.layer_weights.size());

        return ContextualLoss(std::move(normalized), std::move(extractor), std::move(generator));
    }

    std::expected<std::pair<torch::Tensor, torch::Tensor>, std::string>
    ContextualLoss::preprocess(const torch::Tensor& I, const torch::Tensor& T) const {
        auto I_out = I;
        auto T_out = T;

        if (params_.crop_quarter) {
            if (I_out.size(2) % 2 != 0 || I_out.size(3) % 2 != 0) {
                LOG_ERROR("crop_quarter on odd sized features {}", shape_string(I_out));
                return std::unexpected(std::format("crop_quarter needs even feature sizes, got {}",
                                                   shape_string(I_out)));
            }
            I_out = contextual::crop_quarters(I_out);
            T_out = contextual::crop_quarters(T_out);
        }

        const int64_t max_size = params_.max_1d_size;
        if (I_out.size(2) * I_out.size(3) > max_size * max_size) {
            auto pooled = contextual::random_pooling({I_out, T_out}, max_size, generator_);
            if (!pooled) {
                return std::unexpected(pooled.error());
            }
            I_out = pooled->features[0];
            T_out = pooled->features[1];
        }

        return std::make_pair(I_out, T_out);
    }

    std::expected<torch::Tensor, std::string> ContextualLoss::layer_loss(const torch::Tensor& I,
                                                                         const torch::Tensor& T) const {
        return contextual::layer_loss(params_.calc_type, I, T, layer_params_);
    }

    std::expected<torch::Tensor, std::string> ContextualLoss::forward(const torch::Tensor& prediction,
                                                                      const torch::Tensor& target) {
        LOG_TIMER_TRACE("ContextualLoss::forward");
        try {
            if (prediction.dim() != 4 || prediction.sizes() != target.sizes()) {
                LOG_ERROR("Contextual loss inputs differ: {} vs {}", shape_string(prediction), shape_string(target));
                return std::unexpected(std::format("Shape mismatch: prediction {} vs target {}",
                                                   shape_string(prediction), shape_string(target)));
            }

            const auto device = prediction.device();

            if (!extractor_) {
                auto prepared = preprocess(prediction, target.to(device));
                if (!prepared) {
                    return std::unexpected(prepared.error());
                }
                return layer_loss(prepared->first, prepared->second);
            }

            if (prediction.size(1) != 3) {
                LOG_ERROR("{} feature extractor takes 3 channel images, got {}", extractor_->name(), prediction.size(1));
                return std::unexpected(std::format("Feature extractor takes 3 channel images, got {} channels",
                                                   prediction.size(1)));
            }

            auto prediction_features = extractor_->extract(prediction, layers_);
            if (!prediction_features) {
                return std::unexpected(prediction_features.error());
            }
            auto target_features = extractor_->extract(target, layers_);
            if (!target_features) {
                return std::unexpected(target_features.error());
            }

            auto loss = torch::zeros({}, torch::TensorOptions().dtype(torch::kFloat32).device(device));
            for (const auto& [layer, weight] : params_.layer_weights) {
                const auto I_it = prediction_features->find(layer);
                const auto T_it = target_features->find(layer);
                if (I_it == prediction_features->end() || T_it == target_features->end()) {
                    LOG_ERROR("Layer '{}' missing from {} output", layer, extractor_->name());
                    return std::unexpected(std::format("Layer '{}' missing from feature extractor output", layer));
                }

                auto prepared = preprocess(I_it->second.to(device), T_it->second.to(device));
                if (!prepared) {
                    return std::unexpected(prepared.error());
                }

                auto layer_value = layer_loss(prepared->first, prepared->second);
                if (!layer_value) {
                    LOG_ERROR("Contextual loss failed on layer '{}': {}", layer, layer_value.error());
                    return std::unexpected(std::format("{}: {}", layer, layer_value.error()));
                }

                LOG_TRACE("Contextual layer '{}' features {} weight {}", layer, shape_string(prepared->first), weight);
                loss = loss + *layer_value * weight;
            }
            return loss;

        } catch (const std::exception& e) {
            LOG_ERROR("Error computing contextual loss: {}", e.what());
            return std::unexpected(std::format("Error computing contextual loss: {}", e.what()));
        }
    }

} // namespace srl::losses
