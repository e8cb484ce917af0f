/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "numerics.hpp"
#include "core/logger.hpp"
#include <format>

namespace srl::losses {

    std::expected<void, std::string> check_not_degenerate(const torch::Tensor& tensor, const std::string_view name) {
        if (!tensor.defined() || tensor.numel() == 0) {
            return {};
        }

        torch::NoGradGuard no_grad;
        if (torch::isnan(tensor).all().item<bool>() || torch::isinf(tensor).all().item<bool>()) {
            LOG_ERROR("NaN or Inf in {} {}", name, shape_string(tensor));
            return std::unexpected(std::format("NaN or Inf in {}", name));
        }
        return {};
    }

    std::string shape_string(const torch::Tensor& tensor) {
        if (!tensor.defined()) {
            return "[undefined]";
        }
        std::string result = "[";
        for (int64_t i = 0; i < tensor.dim(); ++i) {
            if (i > 0) result += ", ";
            result += std::to_string(tensor.size(i));
        }
        result += "]";
        return result;
    }

} // namespace srl::losses
