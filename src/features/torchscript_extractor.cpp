/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "torchscript_extractor.hpp"
#include "core/logger.hpp"
#include <format>

namespace srl::features {

    TorchScriptFeatureExtractor::TorchScriptFeatureExtractor(ConstructionKey,
                                                             torch::jit::script::Module module,
                                                             Options options)
        : module_(std::move(module)),
          options_(std::move(options)),
          mean_(torch::tensor({0.485f, 0.456f, 0.406f}).view({1, 3, 1, 1})),
          std_(torch::tensor({0.229f, 0.224f, 0.225f}).view({1, 3, 1, 1})) {
    }

    std::expected<std::unique_ptr<TorchScriptFeatureExtractor>, std::string>
    TorchScriptFeatureExtractor::load(const std::filesystem::path& model_path, const Options& options) {
        if (!std::filesystem::exists(model_path)) {
            LOG_ERROR("Feature extractor model not found: {}", model_path.string());
            return std::unexpected("Feature extractor model not found: " + model_path.string());
        }

        try {
            auto module = torch::jit::load(model_path.string(), options.device);
            module.eval();
            for (auto param : module.parameters()) {
                param.set_requires_grad(false);
            }

            LOG_INFO("Loaded {} feature extractor from {} (input_norm={}, range_norm={})",
                     options.net, model_path.string(), options.use_input_norm, options.range_norm);

            return std::make_unique<TorchScriptFeatureExtractor>(ConstructionKey{}, std::move(module), options);

        } catch (const c10::Error& e) {
            LOG_ERROR("Failed to load feature extractor {}: {}", model_path.string(), e.what_without_backtrace());
            return std::unexpected(std::format("Failed to load feature extractor: {}", e.what_without_backtrace()));
        }
    }

    torch::Tensor TorchScriptFeatureExtractor::normalize(const torch::Tensor& image) const {
        auto x = image;
        if (options_.range_norm) {
            x = (x + 1.0) / 2.0;
        }
        if (options_.use_input_norm) {
            const auto mean = mean_.to(x.device(), x.scalar_type());
            const auto stddev = std_.to(x.device(), x.scalar_type());
            x = (x - mean) / stddev;
        }
        return x;
    }

    std::expected<FeatureMapDict, std::string>
    TorchScriptFeatureExtractor::extract(const torch::Tensor& image, const std::vector<std::string>& layers) {
        if (image.dim() != 4 || image.size(1) != 3) {
            return std::unexpected(std::format("{} expects [N, 3, H, W] images, got {} dims",
                                               options_.net, image.dim()));
        }

        try {
            const auto output = module_.forward({normalize(image.to(options_.device))});
            if (!output.isGenericDict()) {
                LOG_ERROR("{} forward returned {} instead of a dict", options_.net, output.tagKind());
                return std::unexpected("Feature extractor must return Dict[str, Tensor]");
            }

            const auto dict = output.toGenericDict();
            FeatureMapDict features;
            for (const auto& layer : layers) {
                const torch::IValue key(layer);
                if (!dict.contains(key)) {
                    LOG_ERROR("Layer '{}' not produced by {}", layer, options_.net);
                    return std::unexpected(std::format("Layer '{}' not produced by feature extractor", layer));
                }
                features.emplace(layer, dict.at(key).toTensor());
            }
            return features;

        } catch (const c10::Error& e) {
            LOG_ERROR("Feature extraction failed: {}", e.what_without_backtrace());
            return std::unexpected(std::format("Feature extraction failed: {}", e.what_without_backtrace()));
        }
    }

    TorchScriptFeatureExtractor::Options extractor_options(const core::param::ContextualLossParameters& params,
                                                           const torch::Device device) {
        return {.net = params.net, .use_input_norm = params.z_norm, .range_norm = params.z_norm, .device = device};
    }

    TorchScriptFeatureExtractor::Options extractor_options(const core::param::PerceptualLossParameters& params,
                                                           const torch::Device device) {
        return {.net = params.vgg_type,
                .use_input_norm = params.use_input_norm,
                .range_norm = params.range_norm,
                .device = device};
    }

} // namespace srl::features
