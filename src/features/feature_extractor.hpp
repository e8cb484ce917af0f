/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <expected>
#include <string>
#include <unordered_map>
#include <vector>
#include <torch/torch.h>

namespace srl::features {

    /// Layer name -> feature map [N, C_l, H_l, W_l]
    using FeatureMapDict = std::unordered_map<std::string, torch::Tensor>;

    /**
     * @brief Interface for fixed, pretrained feature extractors
     *
     * Implementations must be deterministic for fixed weights and input and must
     * not mutate shared state while extracting: losses call extract() once per
     * compared image. Input normalization is the extractor's responsibility.
     */
    class IFeatureExtractor {
    public:
        virtual ~IFeatureExtractor() = default;

        /**
         * @brief Run the network and collect the requested layers
         * @param image [N, 3, H, W] image tensor
         * @param layers Names of the layers to return
         * @return Map containing at least every requested layer, or error string
         */
        virtual std::expected<FeatureMapDict, std::string>
            extract(const torch::Tensor& image, const std::vector<std::string>& layers) = 0;

        /**
         * @brief Identifier of the network variant (e.g. "vgg19")
         */
        virtual std::string name() const = 0;
    };

} // namespace srl::features
