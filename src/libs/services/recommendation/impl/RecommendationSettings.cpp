/*
 * Copyright (C) 2026 Emeric Poupon
 *
 * This file is part of MRS.
 *
 * MRS is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * MRS is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with MRS.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "services/recommendation/RecommendationSettings.hpp"

#include <cmath>
#include <string>

#include "core/IConfig.hpp"
#include "services/recommendation/Exception.hpp"

namespace mrs::recommendation
{
    RecommendationSettings readRecommendationSettings(core::IConfig& config)
    {
        const RecommendationSettings defaults;

        const RecommendationSettings settings{
            .neighborCount = config.getULong("recommendation-neighbor-count", defaults.neighborCount),
            .likedThreshold = config.getDouble("recommendation-liked-threshold", defaults.likedThreshold),
            .maxFeatures = config.getULong("recommendation-max-features", defaults.maxFeatures),
            .minRatingsForCollaborative = config.getULong("recommendation-min-ratings-for-collaborative", defaults.minRatingsForCollaborative),
            .collaborativeWeight = config.getDouble("recommendation-collaborative-weight", defaults.collaborativeWeight),
            .contentWeight = config.getDouble("recommendation-content-weight", defaults.contentWeight),
            .defaultPopularityScore = config.getDouble("recommendation-default-popularity-score", defaults.defaultPopularityScore),
        };

        checkRecommendationSettings(settings);
        return settings;
    }

    void checkRecommendationSettings(const RecommendationSettings& settings)
    {
        if (settings.neighborCount == 0)
            throw Exception{ "Invalid config value for 'recommendation-neighbor-count': must be at least 1" };
        if (settings.maxFeatures == 0)
            throw Exception{ "Invalid config value for 'recommendation-max-features': must be at least 1" };

        auto checkFinite{ [](double value, std::string_view setting) {
            if (!std::isfinite(value))
                throw Exception{ "Invalid config value for '" + std::string{ setting } + "': must be a finite number" };
        } };

        checkFinite(settings.likedThreshold, "recommendation-liked-threshold");
        checkFinite(settings.collaborativeWeight, "recommendation-collaborative-weight");
        checkFinite(settings.contentWeight, "recommendation-content-weight");
        checkFinite(settings.defaultPopularityScore, "recommendation-default-popularity-score");
    }
} // namespace mrs::recommendation
