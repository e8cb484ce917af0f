/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include "feature_extractor.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <torch/script.h>

namespace srl::features {

    /**
     * @brief Feature extractor backed by a serialized TorchScript module
     *
     * The module's forward(image) must return Dict[str, Tensor] keyed by layer
     * name. Parameters are frozen after loading so the extractor never receives
     * gradients; gradients still flow through it to the input image.
     */
    class TorchScriptFeatureExtractor : public IFeatureExtractor {
        struct ConstructionKey {
            explicit ConstructionKey() = default;
        };

    public:
        struct Options {
            std::string net = "vgg19"; ///< Variant identifier, informational
            bool use_input_norm = true; ///< Normalize with ImageNet mean/std
            bool range_norm = false;    ///< Map inputs from [-1, 1] to [0, 1] first
            torch::Device device = torch::kCPU;
        };

        static std::expected<std::unique_ptr<TorchScriptFeatureExtractor>, std::string>
            load(const std::filesystem::path& model_path, const Options& options);

        /// Use load(); the key keeps construction inside this class
        TorchScriptFeatureExtractor(ConstructionKey, torch::jit::script::Module module, Options options);

        std::expected<FeatureMapDict, std::string>
            extract(const torch::Tensor& image, const std::vector<std::string>& layers) override;

        std::string name() const override { return options_.net; }

        const Options& options() const { return options_; }

        /// Apply range and ImageNet normalization as configured
        torch::Tensor normalize(const torch::Tensor& image) const;

    private:
        torch::jit::script::Module module_;
        Options options_;
        torch::Tensor mean_; ///< [1, 3, 1, 1]
        torch::Tensor std_;  ///< [1, 3, 1, 1]
    };

    /// Contextual loss drives both normalizations from z_norm
    TorchScriptFeatureExtractor::Options extractor_options(const core::param::ContextualLossParameters& params,
                                                           torch::Device device = torch::kCPU);

    TorchScriptFeatureExtractor::Options extractor_options(const core::param::PerceptualLossParameters& params,
                                                           torch::Device device = torch::kCPU);

} // namespace srl::features
