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

#include "RecommendationService.hpp"

#include "core/ILogger.hpp"
#include "services/recommendation/Exception.hpp"
#include "services/recommendation/Snapshot.hpp"

namespace mrs::recommendation
{
    namespace
    {
        void checkLimit(std::size_t limit)
        {
            if (limit < 1)
                throw InvalidArgumentException{ "limit must be at least 1" };
        }
    } // namespace

    std::unique_ptr<IRecommendationService> createRecommendationService(const SnapshotStore& snapshotStore, const RecommendationSettings& settings)
    {
        return std::make_unique<RecommendationService>(snapshotStore, settings);
    }

    RecommendationService::RecommendationService(const SnapshotStore& snapshotStore, const RecommendationSettings& settings)
        : _snapshotStore{ snapshotStore }
        , _matrixCache{ settings.maxFeatures }
        , _popularityEngine{ createPopularityEngine(settings) }
    {
        checkRecommendationSettings(settings);

        _engines.emplace(Algorithm::Collaborative, createCollaborativeEngine(settings));
        _engines.emplace(Algorithm::Content, createContentEngine(settings));
        _engines.emplace(Algorithm::Hybrid, createHybridEngine(settings));
    }

    RecommendationResult RecommendationService::computeRecommendations(const UserId& userId, std::size_t limit, Algorithm algorithm) const
    {
        checkLimit(limit);

        const auto matrices{ getCurrentMatrices() };
        RecommendationResult res{ _engines.at(algorithm)->recommend(*matrices, userId, limit) };

        MRS_LOG(RECOMMENDATION, DEBUG, "Computed " << res.size() << " " << getAlgorithmName(algorithm) << " recommendations for user '" << userId << "', snapshot version " << matrices->getSnapshot().version);

        return res;
    }

    RecommendationResult RecommendationService::computePopularity(std::size_t limit) const
    {
        checkLimit(limit);

        return _popularityEngine->recommend(*getCurrentMatrices(), UserId{}, limit);
    }

    std::shared_ptr<const SnapshotMatrices> RecommendationService::getCurrentMatrices() const
    {
        return _matrixCache.getMatrices(_snapshotStore.getCurrent());
    }
} // namespace mrs::recommendation
