/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <torch/torch.h>

namespace srl::losses {

    /**
     * @brief Fail when a tensor is entirely NaN or entirely Inf
     *
     * Only a fully non-finite tensor is reported. Partially corrupted tensors
     * pass and may propagate NaN into the loss; callers that need a stricter
     * guard must check torch::isfinite themselves.
     *
     * @param tensor Tensor to inspect (empty tensors pass)
     * @param name Name used in the error message
     */
    std::expected<void, std::string> check_not_degenerate(const torch::Tensor& tensor, std::string_view name);

    /// "[N, C, H, W]" style rendering of a tensor's sizes for log messages
    std::string shape_string(const torch::Tensor& tensor);

} // namespace srl::losses
