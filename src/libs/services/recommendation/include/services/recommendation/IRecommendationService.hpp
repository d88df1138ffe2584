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
    class SnapshotStore;

    class IRecommendationService
    {
    public:
        virtual ~IRecommendationService() = default;

        // Computations run on the snapshot current at call time
        // Throw InvalidArgumentException if limit is 0
        virtual RecommendationResult computeRecommendations(const UserId& userId, std::size_t limit, Algorithm algorithm) const = 0;
        virtual RecommendationResult computePopularity(std::size_t limit) const = 0;
    };

    std::unique_ptr<IRecommendationService> createRecommendationService(const SnapshotStore& snapshotStore, const RecommendationSettings& settings = {});
} // namespace mrs::recommendation
