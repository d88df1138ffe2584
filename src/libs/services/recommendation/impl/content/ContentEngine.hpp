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

#include <span>

#include "IEngine.hpp"

namespace mrs::recommendation
{
    class ContentSimilarityMatrix;

    // Items whose text is close to the items the user liked
    class ContentEngine : public IEngine
    {
    public:
        ContentEngine(double likedThreshold)
            : _likedThreshold{ likedThreshold } {}

        ContentEngine(const ContentEngine&) = delete;
        ContentEngine& operator=(const ContentEngine&) = delete;

        // ratings may contain ratings of other users
        RecommendationResult recommend(const UserId& userId, std::size_t maxCount, const ContentSimilarityMatrix& similarityMatrix, std::span<const Rating> ratings) const;

    private:
        RecommendationResult recommend(const SnapshotMatrices& matrices, const UserId& userId, std::size_t maxCount) const override;

        const double _likedThreshold;
    };
} // namespace mrs::recommendation
