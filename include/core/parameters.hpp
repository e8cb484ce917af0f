/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace srl::core::param {

    enum class DistanceType : uint8_t {
        Cosine = 0,
        L1 = 1,
        L2 = 2
    };

    enum class CalcType : uint8_t {
        Regular = 0,
        Symmetric = 1,
        Bilateral = 2
    };

    enum class Reduction : uint8_t {
        None = 0,
        Mean = 1,
        Sum = 2
    };

    enum class Criterion : uint8_t {
        L1 = 0,
        L2 = 1,
        Fro = 2,
        Huber = 3
    };

    enum class PixelLossType : uint8_t {
        L1 = 0,
        MSE = 1,
        Charbonnier = 2,
        WeightedTV = 3
    };

    std::expected<DistanceType, std::string> parse_distance_type(std::string_view name);
    std::expected<CalcType, std::string> parse_calc_type(std::string_view name);
    std::expected<Reduction, std::string> parse_reduction(std::string_view name);
    std::expected<Criterion, std::string> parse_criterion(std::string_view name);
    std::expected<PixelLossType, std::string> parse_pixel_loss_type(std::string_view name);

    std::string_view to_string(DistanceType type);
    std::string_view to_string(CalcType type);
    std::string_view to_string(Reduction reduction);
    std::string_view to_string(Criterion criterion);
    std::string_view to_string(PixelLossType type);

    /// Layer name -> weight. Ordered so per-layer accumulation is deterministic.
    using LayerWeights = std::map<std::string, float>;

    /**
     * @brief Map extractor layer aliases such as "conv_3_2" to "conv3_2"
     *
     * Underscores inside the first five characters are dropped, anything else
     * is returned unchanged.
     */
    std::string normalize_layer_name(std::string_view name);

    struct PixelLossParameters {
        PixelLossType type = PixelLossType::L1;
        float loss_weight = 1.0f;
        Reduction reduction = Reduction::Mean;
        float eps = 1e-12f; ///< Charbonnier curvature near zero

        std::expected<void, std::string> validate() const;
        nlohmann::json to_json() const;
        static PixelLossParameters from_json(const nlohmann::json& j);
    };

    struct PerceptualLossParameters {
        LayerWeights layer_weights = {{"conv5_4", 1.0f}};
        std::string vgg_type = "vgg19";
        bool use_input_norm = true;
        bool range_norm = false;
        float perceptual_weight = 1.0f;
        float style_weight = 0.0f;
        Criterion criterion = Criterion::L1;

        std::expected<void, std::string> validate() const;
        nlohmann::json to_json() const;
        static PerceptualLossParameters from_json(const nlohmann::json& j);
    };

    struct ContextualLossParameters {
        float loss_weight = 1.0f;
        LayerWeights layer_weights = {{"conv3_2", 1.0f}, {"conv4_2", 1.0f}};
        bool crop_quarter = false;
        int max_1d_size = 100;
        DistanceType distance_type = DistanceType::Cosine;
        float b = 1.0f;
        float band_width = 0.5f;
        bool use_vgg = true;
        std::string net = "vgg19";
        CalcType calc_type = CalcType::Regular;
        bool z_norm = false;
        float spatial_weight = 0.1f;  ///< Bilateral mode only
        std::optional<uint64_t> seed; ///< Private sampling generator when set

        std::expected<void, std::string> validate() const;
        nlohmann::json to_json() const;
        static ContextualLossParameters from_json(const nlohmann::json& j);
    };

    struct ColorLossParameters {
        Criterion criterion = Criterion::Huber;
        bool avgpool = false;
        int scale = 2;
        float loss_weight = 1.0f;

        std::expected<void, std::string> validate() const;
        nlohmann::json to_json() const;
        static ColorLossParameters from_json(const nlohmann::json& j);
    };

    struct AverageLossParameters {
        Criterion criterion = Criterion::L1;
        float loss_weight = 1.0f;
        int scale = 4;

        std::expected<void, std::string> validate() const;
        nlohmann::json to_json() const;
        static AverageLossParameters from_json(const nlohmann::json& j);
    };

    /**
     * @brief Loss sections of a training configuration
     *
     * Section keys follow the training option files: pixel_opt, perceptual_opt,
     * contextual_opt, color_opt, avg_opt. Absent sections stay disabled.
     */
    struct LossConfig {
        std::optional<PixelLossParameters> pixel;
        std::optional<PerceptualLossParameters> perceptual;
        std::optional<ContextualLossParameters> contextual;
        std::optional<ColorLossParameters> color;
        std::optional<AverageLossParameters> average;

        nlohmann::json to_json() const;
        static LossConfig from_json(const nlohmann::json& j);
    };

    std::expected<LossConfig, std::string> read_loss_config_from_json(const std::filesystem::path& path);
    std::expected<void, std::string> save_loss_config_to_json(const LossConfig& config,
                                                              const std::filesystem::path& path);

} // namespace srl::core::param
