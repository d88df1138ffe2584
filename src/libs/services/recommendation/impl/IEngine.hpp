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
#include <memory>

#include "services/recommendation/RecommendationSettings.hpp"
#include "services/recommendation/Types.hpp"

namespace mrs::recommendation
{
    class SnapshotMatrices;

    class IEngine
    {
    public:
        virtual ~IEngine() = default;

        // Never throws on sparse or unknown data: the result is just empty
        // A maxCount of 0 gives an empty result
        virtual RecommendationResult recommend(const SnapshotMatrices& matrices, const UserId& userId, std::size_t maxCount) const = 0;
    };

    std::unique_ptr<IEngine> createCollaborativeEngine(const RecommendationSettings& settings);
    std::unique_ptr<IEngine> createContentEngine(const RecommendationSettings& settings);
    std::unique_ptr<IEngine> createPopularityEngine(const RecommendationSettings& settings);
    std::unique_ptr<IEngine> createHybridEngine(const RecommendationSettings& settings);
} // namespace mrs::recommendation
