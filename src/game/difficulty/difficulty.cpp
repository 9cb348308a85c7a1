/// @file difficulty.cpp
/// @brief Difficulty presets, validation, and YAML loading.

#include "cge/game/difficulty.hpp"

#include <cmath>

#include "cge/foundation/game_logger.hpp"
#include "cge/game/progression_types.hpp"

namespace cge::game {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

bool validMultiplier(double value) noexcept {
    return std::isfinite(value) && value > 0.0 && value <= kMaxDifficultyMultiplier;
}

}  // namespace

foundation::GameResult<void> DifficultySettings::Validate() const {
    if (talentRange.min > talentRange.max) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidArgument,
            "difficulty '" + id + "' has an empty talent range ["
                + std::to_string(talentRange.min) + ", "
                + std::to_string(talentRange.max) + "]"));
    }
    if (talentRange.min < kMinTalent || talentRange.max > kMaxTalent) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidArgument,
            "difficulty '" + id + "' talent range exceeds ["
                + std::to_string(kMinTalent) + ", " + std::to_string(kMaxTalent) + "]"));
    }
    if (!validMultiplier(experienceMultiplier)) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidArgument,
            "difficulty '" + id + "' experience multiplier must lie in (0, "
                + std::to_string(kMaxDifficultyMultiplier) + "]"));
    }
    if (!validMultiplier(recoveryMultiplier)) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidArgument,
            "difficulty '" + id + "' recovery multiplier must lie in (0, "
                + std::to_string(kMaxDifficultyMultiplier) + "]"));
    }
    return GameResult<void>::ok();
}

const std::vector<DifficultySettings>& DifficultyPresets() {
    static const std::vector<DifficultySettings> presets = {
        {"easy",   "简单", {5, 10}, 3, 1.2, 1.3},
        {"normal", "普通", {1, 10}, 1, 1.0, 1.0},
        {"hard",   "困难", {1, 6},  0, 0.8, 0.7},
    };
    return presets;
}

std::optional<DifficultySettings> FindDifficulty(std::string_view idOrName) {
    for (const auto& preset : DifficultyPresets()) {
        if (preset.id == idOrName || preset.name == idOrName) {
            return preset;
        }
    }
    return std::nullopt;
}

DifficultySettings NormalDifficulty() {
    return DifficultyPresets()[1];
}

namespace {

template <typename T>
bool readInto(const ConfigManager& config, const std::string& key, T& out,
              std::optional<GameError>& error) {
    auto value = config.getOr<T>(key, out);
    if (!value) {
        error = value.error();
        return false;
    }
    out = value.value();
    return true;
}

}  // namespace

GameResult<DifficultySettings> LoadDifficulty(const ConfigManager& config,
                                              std::string_view id) {
    const std::string prefix = "difficulties." + std::string(id) + ".";

    auto base = FindDifficulty(id);
    if (!base && !config.hasKey(prefix + "talent_min")) {
        return GameResult<DifficultySettings>::err(
            GameError(ErrorCode::ConfigKeyNotFound,
                      "no difficulty '" + std::string(id) + "' in configuration"));
    }

    DifficultySettings settings = base.value_or(DifficultySettings{});
    settings.id = std::string(id);
    if (!base) {
        settings.name = settings.id;
    }

    std::optional<GameError> error;
    uint32_t pills = settings.initialPillCount;
    bool ok = readInto(config, prefix + "name", settings.name, error)
           && readInto(config, prefix + "talent_min", settings.talentRange.min, error)
           && readInto(config, prefix + "talent_max", settings.talentRange.max, error)
           && readInto(config, prefix + "initial_pills", pills, error)
           && readInto(config, prefix + "experience_multiplier",
                       settings.experienceMultiplier, error)
           && readInto(config, prefix + "recovery_multiplier",
                       settings.recoveryMultiplier, error);
    if (!ok) {
        return GameResult<DifficultySettings>::err(std::move(*error));
    }
    settings.initialPillCount = pills;

    auto valid = settings.Validate();
    if (!valid) {
        return GameResult<DifficultySettings>::err(
            GameError(ErrorCode::ConfigInvalidValue, std::string(valid.error().message())));
    }

    CGE_LOG_INFO(LogCategory::Config, "loaded difficulty '" + settings.id + "'");
    return GameResult<DifficultySettings>::ok(std::move(settings));
}

}  // namespace cge::game
