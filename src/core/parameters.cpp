/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include "core/logger.hpp"
#include <array>
#include <format>
#include <fstream>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

namespace srl::core::param {

    namespace {
        template <typename E, size_t N>
        std::expected<E, std::string> lookup(const std::array<std::pair<std::string_view, E>, N>& table,
                                             const std::string_view name,
                                             const std::string_view what) {
            for (const auto& [key, value] : table) {
                if (key == name) {
                    return value;
                }
            }
            std::string supported;
            for (const auto& [key, value] : table) {
                if (!supported.empty()) supported += " | ";
                supported += key;
            }
            return std::unexpected(std::format("Unsupported {}: '{}'. Supported: {}", what, name, supported));
        }

        template <typename T>
        T value_or_throw(std::expected<T, std::string> result) {
            if (!result) {
                throw std::invalid_argument(result.error());
            }
            return *result;
        }

        constexpr std::array<std::pair<std::string_view, DistanceType>, 3> DISTANCE_TYPES = {{
            {"cosine", DistanceType::Cosine},
            {"l1", DistanceType::L1},
            {"l2", DistanceType::L2},
        }};

        // "symetric" is the spelling used by existing option files
        constexpr std::array<std::pair<std::string_view, CalcType>, 4> CALC_TYPES = {{
            {"regular", CalcType::Regular},
            {"symetric", CalcType::Symmetric},
            {"symmetric", CalcType::Symmetric},
            {"bilateral", CalcType::Bilateral},
        }};

        constexpr std::array<std::pair<std::string_view, Reduction>, 3> REDUCTIONS = {{
            {"none", Reduction::None},
            {"mean", Reduction::Mean},
            {"sum", Reduction::Sum},
        }};

        constexpr std::array<std::pair<std::string_view, Criterion>, 4> CRITERIA = {{
            {"l1", Criterion::L1},
            {"l2", Criterion::L2},
            {"fro", Criterion::Fro},
            {"huber", Criterion::Huber},
        }};

        constexpr std::array<std::pair<std::string_view, PixelLossType>, 4> PIXEL_LOSS_TYPES = {{
            {"L1Loss", PixelLossType::L1},
            {"MSELoss", PixelLossType::MSE},
            {"CharbonnierLoss", PixelLossType::Charbonnier},
            {"WeightedTVLoss", PixelLossType::WeightedTV},
        }};

        LayerWeights layer_weights_from_json(const nlohmann::json& j, const bool normalize_names) {
            LayerWeights weights;
            for (auto it = j.begin(); it != j.end(); ++it) {
                weights[normalize_names ? normalize_layer_name(it.key()) : it.key()] = it.value().get<float>();
            }
            return weights;
        }

        nlohmann::json layer_weights_to_json(const LayerWeights& weights) {
            nlohmann::json j = nlohmann::json::object();
            for (const auto& [name, weight] : weights) {
                j[name] = weight;
            }
            return j;
        }

        std::expected<void, std::string> validate_layer_weights(const LayerWeights& weights) {
            for (const auto& [name, weight] : weights) {
                if (!(weight > 0.0f)) {
                    return std::unexpected(std::format("Layer weight for '{}' must be positive, got {}", name, weight));
                }
            }
            return {};
        }

        void check_type(const nlohmann::json& j, std::initializer_list<std::string_view> accepted) {
            if (!j.contains("type")) {
                return;
            }
            const auto type = j["type"].get<std::string>();
            for (const auto name : accepted) {
                if (type == name) {
                    return;
                }
            }
            throw std::invalid_argument(std::format("Unexpected loss type '{}' in section", type));
        }
    } // namespace

    std::expected<DistanceType, std::string> parse_distance_type(const std::string_view name) {
        return lookup(DISTANCE_TYPES, name, "distance type");
    }

    std::expected<CalcType, std::string> parse_calc_type(const std::string_view name) {
        return lookup(CALC_TYPES, name, "calc type");
    }

    std::expected<Reduction, std::string> parse_reduction(const std::string_view name) {
        return lookup(REDUCTIONS, name, "reduction mode");
    }

    std::expected<Criterion, std::string> parse_criterion(const std::string_view name) {
        return lookup(CRITERIA, name, "criterion");
    }

    std::expected<PixelLossType, std::string> parse_pixel_loss_type(const std::string_view name) {
        return lookup(PIXEL_LOSS_TYPES, name, "pixel loss type");
    }

    std::string_view to_string(const DistanceType type) {
        switch (type) {
        case DistanceType::Cosine: return "cosine";
        case DistanceType::L1:     return "l1";
        case DistanceType::L2:     return "l2";
        }
        return "cosine";
    }

    std::string_view to_string(const CalcType type) {
        switch (type) {
        case CalcType::Regular:   return "regular";
        case CalcType::Symmetric: return "symetric";
        case CalcType::Bilateral: return "bilateral";
        }
        return "regular";
    }

    std::string_view to_string(const Reduction reduction) {
        switch (reduction) {
        case Reduction::None: return "none";
        case Reduction::Mean: return "mean";
        case Reduction::Sum:  return "sum";
        }
        return "mean";
    }

    std::string_view to_string(const Criterion criterion) {
        switch (criterion) {
        case Criterion::L1:    return "l1";
        case Criterion::L2:    return "l2";
        case Criterion::Fro:   return "fro";
        case Criterion::Huber: return "huber";
        }
        return "l1";
    }

    std::string_view to_string(const PixelLossType type) {
        switch (type) {
        case PixelLossType::L1:          return "L1Loss";
        case PixelLossType::MSE:         return "MSELoss";
        case PixelLossType::Charbonnier: return "CharbonnierLoss";
        case PixelLossType::WeightedTV:  return "WeightedTVLoss";
        }
        return "L1Loss";
    }

    std::string normalize_layer_name(const std::string_view name) {
        const auto prefix = name.substr(0, 5);
        if (prefix.find('_') == std::string_view::npos) {
            return std::string(name);
        }
        std::string result;
        for (const char c : prefix) {
            if (c != '_') result += c;
        }
        result += name.substr(prefix.size());
        return result;
    }

    // ---------------------------------------------------------------------
    // PixelLossParameters
    // ---------------------------------------------------------------------

    std::expected<void, std::string> PixelLossParameters::validate() const {
        if (type == PixelLossType::WeightedTV && reduction == Reduction::None) {
            return std::unexpected("Unsupported reduction mode for WeightedTVLoss: none. Supported: mean | sum");
        }
        if (type == PixelLossType::Charbonnier && !(eps > 0.0f)) {
            return std::unexpected(std::format("Charbonnier eps must be positive, got {}", eps));
        }
        return {};
    }

    nlohmann::json PixelLossParameters::to_json() const {
        nlohmann::json j;
        j["type"] = std::string(to_string(type));
        j["loss_weight"] = loss_weight;
        j["reduction"] = std::string(to_string(reduction));
        if (type == PixelLossType::Charbonnier) {
            j["eps"] = eps;
        }
        return j;
    }

    PixelLossParameters PixelLossParameters::from_json(const nlohmann::json& j) {
        PixelLossParameters params;
        if (j.contains("type")) {
            params.type = value_or_throw(parse_pixel_loss_type(j["type"].get<std::string>()));
        }
        params.loss_weight = j.value("loss_weight", params.loss_weight);
        if (j.contains("reduction")) {
            params.reduction = value_or_throw(parse_reduction(j["reduction"].get<std::string>()));
        }
        params.eps = j.value("eps", params.eps);
        return params;
    }

    // ---------------------------------------------------------------------
    // PerceptualLossParameters
    // ---------------------------------------------------------------------

    std::expected<void, std::string> PerceptualLossParameters::validate() const {
        if (criterion == Criterion::Huber) {
            return std::unexpected("huber criterion has not been supported for PerceptualLoss");
        }
        if (layer_weights.empty()) {
            return std::unexpected("PerceptualLoss requires at least one layer weight");
        }
        return validate_layer_weights(layer_weights);
    }

    nlohmann::json PerceptualLossParameters::to_json() const {
        nlohmann::json j;
        j["type"] = "PerceptualLoss";
        j["layer_weights"] = layer_weights_to_json(layer_weights);
        j["vgg_type"] = vgg_type;
        j["use_input_norm"] = use_input_norm;
        j["range_norm"] = range_norm;
        j["perceptual_weight"] = perceptual_weight;
        j["style_weight"] = style_weight;
        j["criterion"] = std::string(to_string(criterion));
        return j;
    }

    PerceptualLossParameters PerceptualLossParameters::from_json(const nlohmann::json& j) {
        check_type(j, {"PerceptualLoss"});
        PerceptualLossParameters params;
        if (j.contains("layer_weights")) {
            params.layer_weights = layer_weights_from_json(j["layer_weights"], false);
        }
        params.vgg_type = j.value("vgg_type", params.vgg_type);
        params.use_input_norm = j.value("use_input_norm", params.use_input_norm);
        params.range_norm = j.value("range_norm", params.range_norm);
        params.perceptual_weight = j.value("perceptual_weight", params.perceptual_weight);
        params.style_weight = j.value("style_weight", params.style_weight);
        if (j.contains("criterion")) {
            params.criterion = value_or_throw(parse_criterion(j["criterion"].get<std::string>()));
        }
        return params;
    }

    // ---------------------------------------------------------------------
    // ContextualLossParameters
    // ---------------------------------------------------------------------

    std::expected<void, std::string> ContextualLossParameters::validate() const {
        if (!(band_width > 0.0f)) {
            return std::unexpected(std::format("band_width parameter must be positive, got {}", band_width));
        }
        if (max_1d_size < 1) {
            return std::unexpected(std::format("max_1d_size must be at least 1, got {}", max_1d_size));
        }
        if (!(spatial_weight >= 0.0f && spatial_weight <= 1.0f)) {
            return std::unexpected(std::format("spatial_weight must lie in [0, 1], got {}", spatial_weight));
        }
        return validate_layer_weights(layer_weights);
    }

    nlohmann::json ContextualLossParameters::to_json() const {
        nlohmann::json j;
        j["type"] = "ContextualLoss";
        j["loss_weight"] = loss_weight;
        j["layer_weights"] = layer_weights_to_json(layer_weights);
        j["crop_quarter"] = crop_quarter;
        j["max_1d_size"] = max_1d_size;
        j["distance_type"] = std::string(to_string(distance_type));
        j["b"] = b;
        j["band_width"] = band_width;
        j["use_vgg"] = use_vgg;
        j["net"] = net;
        j["calc_type"] = std::string(to_string(calc_type));
        j["z_norm"] = z_norm;
        j["spatial_weight"] = spatial_weight;
        if (seed) {
            j["seed"] = *seed;
        }
        return j;
    }

    ContextualLossParameters ContextualLossParameters::from_json(const nlohmann::json& j) {
        check_type(j, {"ContextualLoss"});
        ContextualLossParameters params;
        params.loss_weight = j.value("loss_weight", params.loss_weight);
        if (j.contains("layer_weights")) {
            params.layer_weights = j["layer_weights"].is_null()
                                       ? LayerWeights{}
                                       : layer_weights_from_json(j["layer_weights"], true);
        }
        params.crop_quarter = j.value("crop_quarter", params.crop_quarter);
        params.max_1d_size = j.value("max_1d_size", params.max_1d_size);
        if (j.contains("distance_type")) {
            params.distance_type = value_or_throw(parse_distance_type(j["distance_type"].get<std::string>()));
        }
        params.b = j.value("b", params.b);
        params.band_width = j.value("band_width", params.band_width);
        params.use_vgg = j.value("use_vgg", params.use_vgg);
        params.net = j.value("net", params.net);
        if (j.contains("calc_type")) {
            params.calc_type = value_or_throw(parse_calc_type(j["calc_type"].get<std::string>()));
        }
        params.z_norm = j.value("z_norm", params.z_norm);
        params.spatial_weight = j.value("spatial_weight", params.spatial_weight);
        if (j.contains("seed") && !j["seed"].is_null()) {
            params.seed = j["seed"].get<uint64_t>();
        }
        return params;
    }

    // ---------------------------------------------------------------------
    // ColorLossParameters / AverageLossParameters
    // ---------------------------------------------------------------------

    std::expected<void, std::string> ColorLossParameters::validate() const {
        if (criterion == Criterion::Fro) {
            return std::unexpected("fro criterion has not been supported for ColorLoss");
        }
        if (avgpool && scale < 1) {
            return std::unexpected(std::format("ColorLoss scale must be at least 1, got {}", scale));
        }
        return {};
    }

    nlohmann::json ColorLossParameters::to_json() const {
        nlohmann::json j;
        j["type"] = "ColorLoss";
        j["criterion"] = std::string(to_string(criterion));
        j["avgpool"] = avgpool;
        j["scale"] = scale;
        j["loss_weight"] = loss_weight;
        return j;
    }

    ColorLossParameters ColorLossParameters::from_json(const nlohmann::json& j) {
        check_type(j, {"ColorLoss", "colorloss"});
        ColorLossParameters params;
        if (j.contains("criterion")) {
            params.criterion = value_or_throw(parse_criterion(j["criterion"].get<std::string>()));
        }
        params.avgpool = j.value("avgpool", params.avgpool);
        params.scale = j.value("scale", params.scale);
        params.loss_weight = j.value("loss_weight", params.loss_weight);
        return params;
    }

    std::expected<void, std::string> AverageLossParameters::validate() const {
        if (criterion != Criterion::L1 && criterion != Criterion::L2) {
            return std::unexpected(std::format("{} criterion has not been supported for AverageLoss",
                                               to_string(criterion)));
        }
        if (scale < 1) {
            return std::unexpected(std::format("AverageLoss scale must be at least 1, got {}", scale));
        }
        return {};
    }

    nlohmann::json AverageLossParameters::to_json() const {
        nlohmann::json j;
        j["type"] = "AverageLoss";
        j["criterion"] = std::string(to_string(criterion));
        j["loss_weight"] = loss_weight;
        j["scale"] = scale;
        return j;
    }

    AverageLossParameters AverageLossParameters::from_json(const nlohmann::json& j) {
        check_type(j, {"AverageLoss"});
        AverageLossParameters params;
        if (j.contains("criterion")) {
            params.criterion = value_or_throw(parse_criterion(j["criterion"].get<std::string>()));
        }
        params.loss_weight = j.value("loss_weight", params.loss_weight);
        params.scale = j.value("scale", params.scale);
        return params;
    }

    // ---------------------------------------------------------------------
    // LossConfig
    // ---------------------------------------------------------------------

    nlohmann::json LossConfig::to_json() const {
        nlohmann::json j = nlohmann::json::object();
        if (pixel) j["pixel_opt"] = pixel->to_json();
        if (perceptual) j["perceptual_opt"] = perceptual->to_json();
        if (contextual) j["contextual_opt"] = contextual->to_json();
        if (color) j["color_opt"] = color->to_json();
        if (average) j["avg_opt"] = average->to_json();
        return j;
    }

    LossConfig LossConfig::from_json(const nlohmann::json& j) {
        LossConfig config;
        if (j.contains("pixel_opt")) config.pixel = PixelLossParameters::from_json(j["pixel_opt"]);
        if (j.contains("perceptual_opt")) config.perceptual = PerceptualLossParameters::from_json(j["perceptual_opt"]);
        if (j.contains("contextual_opt")) config.contextual = ContextualLossParameters::from_json(j["contextual_opt"]);
        if (j.contains("color_opt")) config.color = ColorLossParameters::from_json(j["color_opt"]);
        if (j.contains("avg_opt")) config.average = AverageLossParameters::from_json(j["avg_opt"]);
        return config;
    }

    std::expected<LossConfig, std::string> read_loss_config_from_json(const std::filesystem::path& path) {
        try {
            std::ifstream file(path);
            if (!file) {
                LOG_ERROR("Failed to open loss config: {}", path.string());
                return std::unexpected("Failed to open: " + path.string());
            }

            const auto j = nlohmann::json::parse(file);
            auto config = LossConfig::from_json(j);

            const auto check = [&path](const char* section, const std::expected<void, std::string>& result)
                -> std::expected<void, std::string> {
                if (!result) {
                    LOG_ERROR("Invalid {} in {}: {}", section, path.string(), result.error());
                    return std::unexpected(std::format("{}: {}", section, result.error()));
                }
                return {};
            };

            if (config.pixel) {
                if (auto r = check("pixel_opt", config.pixel->validate()); !r) return std::unexpected(r.error());
            }
            if (config.perceptual) {
                if (auto r = check("perceptual_opt", config.perceptual->validate()); !r) return std::unexpected(r.error());
            }
            if (config.contextual) {
                if (auto r = check("contextual_opt", config.contextual->validate()); !r) return std::unexpected(r.error());
            }
            if (config.color) {
                if (auto r = check("color_opt", config.color->validate()); !r) return std::unexpected(r.error());
            }
            if (config.average) {
                if (auto r = check("avg_opt", config.average->validate()); !r) return std::unexpected(r.error());
            }

            LOG_DEBUG("Loss config loaded from {}", path.string());
            return config;

        } catch (const std::exception& e) {
            LOG_ERROR("Failed to read loss config {}: {}", path.string(), e.what());
            return std::unexpected(std::format("Read loss config failed: {}", e.what()));
        }
    }

    std::expected<void, std::string> save_loss_config_to_json(const LossConfig& config,
                                                              const std::filesystem::path& path) {
        try {
            std::ofstream file(path);
            if (!file) {
                return std::unexpected("Failed to open: " + path.string());
            }
            file << config.to_json().dump(4);
            return {};
        } catch (const std::exception& e) {
            return std::unexpected(std::format("Save loss config failed: {}", e.what()));
        }
    }

} // namespace srl::core::param
