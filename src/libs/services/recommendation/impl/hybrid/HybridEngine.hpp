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

#include "IEngine.hpp"

namespace mrs::recommendation
{
    // Picks the personalized engines depending on how much the user rated,
    // and falls back on popularity when they have nothing to propose
    class HybridEngine : public IEngine
    {
    public:
        HybridEngine(const RecommendationSettings& settings);
        ~HybridEngine() override;

        HybridEngine(const HybridEngine&) = delete;
        HybridEngine& operator=(const HybridEngine&) = delete;

        enum class Branch
        {
            Blend,       // collaborative + content
            ContentOnly,
            None,        // no rating: popularity only
        };
        Branch selectBranch(std::size_t userRatingCount) const;

        // Weighted sum of both results
        RecommendationResult blend(const RecommendationResult& collaborativeResult, const RecommendationResult& contentResult, std::size_t maxCount) const;

    private:
        RecommendationResult recommend(const SnapshotMatrices& matrices, const UserId& userId, std::size_t maxCount) const override;

        const RecommendationSettings _settings;
        const std::unique_ptr<IEngine> _collaborativeEngine;
        const std::unique_ptr<IEngine> _contentEngine;
        const std::unique_ptr<IEngine> _popularityEngine;
    };
} // namespace mrs::recommendation
