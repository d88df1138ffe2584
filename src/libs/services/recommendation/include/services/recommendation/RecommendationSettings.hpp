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

#pragma once

#include <cstddef>

namespace mrs::core
{
    class IConfig;
}

namespace mrs::recommendation
{
    struct RecommendationSettings
    {
        // Collaborative filtering
        std::size_t neighborCount{ 10 };

        // Content based filtering
        double likedThreshold{ 4 };
        std::size_t maxFeatures{ 1000 }; // TF-IDF vocabulary cap

        // Hybrid blending
        std::size_t minRatingsForCollaborative{ 5 };
        double collaborativeWeight{ 0.7 };
        double contentWeight{ 0.3 };

        // Popularity fallback
        double defaultPopularityScore{ 2.5 };
    };

    // Throws on out of range values
    RecommendationSettings readRecommendationSettings(core::IConfig& config);
    void checkRecommendationSettings(const RecommendationSettings& settings);
} // namespace mrs::recommendation
