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

#include "CollaborativeEngine.hpp"

#include <algorithm>
#include <vector>

#include "core/ILogger.hpp"

#include "MatrixBuilder.hpp"
#include "MatrixCache.hpp"
#include "ScoreAggregator.hpp"

namespace mrs::recommendation
{
    namespace
    {
        struct Neighbor
        {
            std::size_t userIndex;
            double similarity;
        };

        std::vector<Neighbor> findNeighbors(const UserItemMatrix& matrix, std::size_t userIndex, std::size_t neighborCount)
        {
            const std::span<const double> userScores{ matrix.getUserScores(userIndex) };

            std::vector<Neighbor> neighbors;
            neighbors.reserve(matrix.getUsers().size());
            for (std::size_t otherUserIndex{}; otherUserIndex < matrix.getUsers().size(); ++otherUserIndex)
            {
                if (otherUserIndex == userIndex)
                    continue;

                neighbors.push_back(Neighbor{ otherUserIndex, computeCosineSimilarity(userScores, matrix.getUserScores(otherUserIndex)) });
            }

            std::stable_sort(std::begin(neighbors), std::end(neighbors), [](const Neighbor& a, const Neighbor& b) { return a.similarity > b.similarity; });
            if (neighbors.size() > neighborCount)
                neighbors.resize(neighborCount);

            return neighbors;
        }
    } // namespace

    std::unique_ptr<IEngine> createCollaborativeEngine(const RecommendationSettings& settings)
    {
        return std::make_unique<CollaborativeEngine>(settings.neighborCount);
    }

    RecommendationResult CollaborativeEngine::recommend(const SnapshotMatrices& matrices, const UserId& userId, std::size_t maxCount) const
    {
        const UserItemMatrix* matrix{ matrices.getUserItemMatrix() };
        if (!matrix)
            return {};

        return recommend(userId, maxCount, *matrix);
    }

    RecommendationResult CollaborativeEngine::recommend(const UserId& userId, std::size_t maxCount, const UserItemMatrix& matrix) const
    {
        if (maxCount == 0)
            return {};

        const std::optional<std::size_t> userIndex{ matrix.findUserIndex(userId) };
        if (!userIndex)
        {
            MRS_LOG(RECOMMENDATION, DEBUG, "User '" << userId << "' not found in user item matrix");
            return {};
        }

        const std::vector<Neighbor> neighbors{ findNeighbors(matrix, *userIndex, _neighborCount) };
        const std::span<const double> userScores{ matrix.getUserScores(*userIndex) };

        // Mean of raw rating * similarity products, not normalized by the similarity sum
        ScoreAggregator aggregator;
        for (const Neighbor& neighbor : neighbors)
        {
            const std::span<const double> neighborScores{ matrix.getUserScores(neighbor.userIndex) };
            for (std::size_t itemIndex{}; itemIndex < neighborScores.size(); ++itemIndex)
            {
                if (neighborScores[itemIndex] > 0 && userScores[itemIndex] <= 0)
                    aggregator.addContribution(matrix.getItems()[itemIndex], neighborScores[itemIndex] * neighbor.similarity);
            }
        }

        MRS_LOG(RECOMMENDATION, DEBUG, "Collaborative: user '" << userId << "', " << neighbors.size() << " neighbors, " << aggregator.getItemCount() << " candidates");

        return aggregator.getMeanScores(maxCount);
    }
} // namespace mrs::recommendation
