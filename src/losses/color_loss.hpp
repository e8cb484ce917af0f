/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include <expected>
#include <string>
#include <torch/torch.h>

namespace srl::losses {

    /**
     * @brief RGB [N, 3, H, W] in [0, 1] to chroma [N, 2, H, W] (Cb, Cr)
     *
     * BT.601 luma with a 0.5 chroma offset.
     */
    torch::Tensor rgb_to_cbcr(const torch::Tensor& rgb);

    /**
     * @brief Color consistency loss comparing chroma only
     *
     * Both images are converted to CbCr, optionally average-pooled by
     * Params::scale, then compared with the configured criterion.
     */
    class ColorLoss {
    public:
        using Params = core::param::ColorLossParameters;

        static std::expected<ColorLoss, std::string> create(const Params& params);

        std::expected<torch::Tensor, std::string> forward(const torch::Tensor& input,
                                                          const torch::Tensor& target) const;

        const Params& params() const { return params_; }

    private:
        explicit ColorLoss(Params params) : params_(std::move(params)) {}

        Params params_;
    };

    /// Criterion between average-pooled (downscaled by Params::scale) images
    class AverageLoss {
    public:
        using Params = core::param::AverageLossParameters;

        static std::expected<AverageLoss, std::string> create(const Params& params);

        std::expected<torch::Tensor, std::string> forward(const torch::Tensor& x,
                                                          const torch::Tensor& y) const;

        const Params& params() const { return params_; }

    private:
        explicit AverageLoss(Params params) : params_(std::move(params)) {}

        Params params_;
    };

} // namespace srl::losses
