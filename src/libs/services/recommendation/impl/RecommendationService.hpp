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

#include <map>
#include <memory>

#include "services/recommendation/IRecommendationService.hpp"

#include "IEngine.hpp"
#include "MatrixCache.hpp"

namespace mrs::recommendation
{
    class RecommendationService : public IRecommendationService
    {
    public:
        RecommendationService(const SnapshotStore& snapshotStore, const RecommendationSettings& settings);
        ~RecommendationService() override = default;
        RecommendationService(const RecommendationService&) = delete;
        RecommendationService& operator=(const RecommendationService&) = delete;

    private:
        RecommendationResult computeRecommendations(const UserId& userId, std::size_t limit, Algorithm algorithm) const override;
        RecommendationResult computePopularity(std::size_t limit) const override;

        std::shared_ptr<const SnapshotMatrices> getCurrentMatrices() const;

        const SnapshotStore& _snapshotStore;
        mutable MatrixCache _matrixCache;
        std::map<Algorithm, std::unique_ptr<IEngine>> _engines;
        std::unique_ptr<IEngine> _popularityEngine;
    };
} // namespace mrs::recommendation
