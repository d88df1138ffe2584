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

#include "HybridEngine.hpp"

#include <algorithm>

#include "core/ILogger.hpp"

#include "MatrixCache.hpp"
#include "ScoreAggregator.hpp"

namespace mrs::recommendation
{
    std::unique_ptr<IEngine> createHybridEngine(const RecommendationSettings& settings)
    {
        return std::make_unique<HybridEngine>(settings);
    }

    HybridEngine::HybridEngine(const RecommendationSettings& settings)
        : _settings{ settings }
        , _collaborativeEngine{ createCollaborativeEngine(settings) }
        , _contentEngine{ createContentEngine(settings) }
        , _popularityEngine{ createPopularityEngine(settings) }
    {
    }

    HybridEngine::~HybridEngine() = default;

    HybridEngine::Branch HybridEngine::selectBranch(std::size_t userRatingCount) const
    {
        if (userRatingCount >= _settings.minRatingsForCollaborative)
            return Branch::Blend;
        if (userRatingCount > 0)
            return Branch::ContentOnly;

        return Branch::None;
    }

    RecommendationResult HybridEngine::blend(const RecommendationResult& collaborativeResult, const RecommendationResult& contentResult, std::size_t maxCount) const
    {
        ScoreAggregator aggregator;
        for (const ScoredItem& scoredItem : collaborativeResult)
            aggregator.addContribution(scoredItem.itemId, scoredItem.score * _settings.collaborativeWeight);
        for (const ScoredItem& scoredItem : contentResult)
            aggregator.addContribution(scoredItem.itemId, scoredItem.score * _settings.contentWeight);

        return aggregator.getSumScores(maxCount);
    }

    RecommendationResult HybridEngine::recommend(const SnapshotMatrices& matrices, const UserId& userId, std::size_t maxCount) const
    {
        if (maxCount == 0)
            return {};

        const auto& ratings{ matrices.getSnapshot().ratings };
        const std::size_t userRatingCount{ static_cast<std::size_t>(std::count_if(std::cbegin(ratings), std::cend(ratings), [&](const Rating& rating) { return rating.userId == userId; })) };

        RecommendationResult res;
        switch (selectBranch(userRatingCount))
        {
        case Branch::Blend:
            res = blend(_collaborativeEngine->recommend(matrices, userId, maxCount), _contentEngine->recommend(matrices, userId, maxCount / 2), maxCount);
            break;

        case Branch::ContentOnly:
            res = _contentEngine->recommend(matrices, userId, maxCount);
            break;

        case Branch::None:
            break;
        }

        if (res.empty())
        {
            MRS_LOG(RECOMMENDATION, INFO, "No personalized recommendation for user '" << userId << "' (" << userRatingCount << " ratings), using popularity fallback");
            res = _popularityEngine->recommend(matrices, userId, maxCount);
        }

        return res;
    }
} // namespace mrs::recommendation
