/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "pixel_loss.hpp"
#include "core/logger.hpp"
#include "numerics.hpp"
#include <format>

namespace srl::losses {

    namespace F = torch::nn::functional;
    using torch::indexing::Slice;

    namespace {
        std::expected<void, std::string> check_same_shape(const torch::Tensor& pred, const torch::Tensor& target) {
            if (pred.sizes() != target.sizes()) {
                LOG_ERROR("Pixel loss shape mismatch: {} vs {}", shape_string(pred), shape_string(target));
                return std::unexpected(std::format("Shape mismatch: pred {} vs target {}",
                                                   shape_string(pred), shape_string(target)));
            }
            return {};
        }

        template <typename ElementLoss>
        std::expected<torch::Tensor, std::string> elementwise(const char* name,
                                                              const torch::Tensor& pred,
                                                              const torch::Tensor& target,
                                                              const torch::Tensor& weight,
                                                              const float loss_weight,
                                                              const Reduction reduction,
                                                              ElementLoss&& element_loss) {
            try {
                if (auto r = check_same_shape(pred, target); !r) {
                    return std::unexpected(r.error());
                }
                auto reduced = weight_reduce_loss(element_loss(pred, target), weight, reduction);
                if (!reduced) {
                    return std::unexpected(reduced.error());
                }
                return *reduced * loss_weight;
            } catch (const std::exception& e) {
                LOG_ERROR("Error computing {}: {}", name, e.what());
                return std::unexpected(std::format("Error computing {}: {}", name, e.what()));
            }
        }
    } // namespace

    std::expected<torch::Tensor, std::string> weight_reduce_loss(const torch::Tensor& loss,
                                                                 const torch::Tensor& weight,
                                                                 const Reduction reduction) {
        if (!weight.defined()) {
            switch (reduction) {
            case Reduction::None: return loss;
            case Reduction::Mean: return loss.mean();
            case Reduction::Sum:  return loss.sum();
            }
            return std::unexpected("Unsupported reduction mode");
        }

        if (weight.dim() != loss.dim() || (weight.size(1) != 1 && weight.size(1) != loss.size(1))) {
            LOG_ERROR("Loss weight {} incompatible with loss {}", shape_string(weight), shape_string(loss));
            return std::unexpected(std::format("Weight {} incompatible with loss {}",
                                               shape_string(weight), shape_string(loss)));
        }

        const auto weighted = loss * weight;
        switch (reduction) {
        case Reduction::None: return weighted;
        case Reduction::Sum:  return weighted.sum();
        case Reduction::Mean: {
            const auto denominator = weight.size(1) > 1 ? weight.sum() : weight.sum() * loss.size(1);
            return weighted.sum() / denominator;
        }
        }
        return std::unexpected("Unsupported reduction mode");
    }

    torch::Tensor criterion_loss(const Criterion criterion, const torch::Tensor& a, const torch::Tensor& b) {
        switch (criterion) {
        case Criterion::L1:    return F::l1_loss(a, b);
        case Criterion::L2:    return F::mse_loss(a, b);
        case Criterion::Fro:   return torch::norm(a - b);
        case Criterion::Huber: return F::huber_loss(a, b, F::HuberLossFuncOptions().delta(1.0));
        }
        return F::l1_loss(a, b);
    }

    std::expected<torch::Tensor, std::string> L1Loss::forward(const torch::Tensor& pred,
                                                              const torch::Tensor& target,
                                                              const Params& params,
                                                              const torch::Tensor& weight) {
        return elementwise("L1Loss", pred, target, weight, params.loss_weight, params.reduction,
                           [](const torch::Tensor& p, const torch::Tensor& t) { return torch::abs(p - t); });
    }

    std::expected<torch::Tensor, std::string> MSELoss::forward(const torch::Tensor& pred,
                                                               const torch::Tensor& target,
                                                               const Params& params,
                                                               const torch::Tensor& weight) {
        return elementwise("MSELoss", pred, target, weight, params.loss_weight, params.reduction,
                           [](const torch::Tensor& p, const torch::Tensor& t) { return (p - t).pow(2); });
    }

    std::expected<torch::Tensor, std::string> CharbonnierLoss::forward(const torch::Tensor& pred,
                                                                       const torch::Tensor& target,
                                                                       const Params& params,
                                                                       const torch::Tensor& weight) {
        const double eps = params.eps;
        return elementwise("CharbonnierLoss", pred, target, weight, params.loss_weight, params.reduction,
                           [eps](const torch::Tensor& p, const torch::Tensor& t) {
                               return torch::sqrt((p - t).pow(2) + eps);
                           });
    }

    std::expected<torch::Tensor, std::string> WeightedTVLoss::forward(const torch::Tensor& pred,
                                                                      const Params& params,
                                                                      const torch::Tensor& weight) {
        if (params.reduction == Reduction::None) {
            LOG_ERROR("WeightedTVLoss does not support reduction 'none'");
            return std::unexpected("Unsupported reduction mode: none. Supported ones are: mean | sum");
        }
        if (pred.dim() != 4) {
            return std::unexpected(std::format("WeightedTVLoss expects [N, C, H, W], got {}", shape_string(pred)));
        }

        torch::Tensor y_weight;
        torch::Tensor x_weight;
        if (weight.defined()) {
            y_weight = weight.index({Slice(), Slice(), Slice(torch::indexing::None, -1), Slice()});
            x_weight = weight.index({Slice(), Slice(), Slice(), Slice(torch::indexing::None, -1)});
        }

        const L1Loss::Params l1_params{.loss_weight = params.loss_weight, .reduction = params.reduction};

        auto y_diff = L1Loss::forward(pred.index({Slice(), Slice(), Slice(torch::indexing::None, -1), Slice()}),
                                      pred.index({Slice(), Slice(), Slice(1, torch::indexing::None), Slice()}),
                                      l1_params, y_weight);
        if (!y_diff) {
            return y_diff;
        }
        auto x_diff = L1Loss::forward(pred.index({Slice(), Slice(), Slice(), Slice(torch::indexing::None, -1)}),
                                      pred.index({Slice(), Slice(), Slice(), Slice(1, torch::indexing::None)}),
                                      l1_params, x_weight);
        if (!x_diff) {
            return x_diff;
        }
        return *x_diff + *y_diff;
    }

    std::expected<torch::Tensor, std::string> pixel_loss(const core::param::PixelLossParameters& params,
                                                         const torch::Tensor& pred,
                                                         const torch::Tensor& target,
                                                         const torch::Tensor& weight) {
        if (auto valid = params.validate(); !valid) {
            return std::unexpected(valid.error());
        }

        using core::param::PixelLossType;
        switch (params.type) {
        case PixelLossType::L1:
            return L1Loss::forward(pred, target, {.loss_weight = params.loss_weight, .reduction = params.reduction}, weight);
        case PixelLossType::MSE:
            return MSELoss::forward(pred, target, {.loss_weight = params.loss_weight, .reduction = params.reduction}, weight);
        case PixelLossType::Charbonnier:
            return CharbonnierLoss::forward(pred, target,
                                            {.loss_weight = params.loss_weight, .reduction = params.reduction, .eps = params.eps},
                                            weight);
        case PixelLossType::WeightedTV:
            return WeightedTVLoss::forward(pred, {.loss_weight = params.loss_weight, .reduction = params.reduction}, weight);
        }
        return std::unexpected("Unsupported pixel loss type");
    }

} // namespace srl::losses
