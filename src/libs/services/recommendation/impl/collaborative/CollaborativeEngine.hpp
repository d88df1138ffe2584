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
    class UserItemMatrix;

    // User based collaborative filtering: items liked by the most similar users
    class CollaborativeEngine : public IEngine
    {
    public:
        CollaborativeEngine(std::size_t neighborCount)
            : _neighborCount{ neighborCount } {}

        CollaborativeEngine(const CollaborativeEngine&) = delete;
        CollaborativeEngine& operator=(const CollaborativeEngine&) = delete;

        RecommendationResult recommend(const UserId& userId, std::size_t maxCount, const UserItemMatrix& matrix) const;

    private:
        RecommendationResult recommend(const SnapshotMatrices& matrices, const UserId& userId, std::size_t maxCount) const override;

        const std::size_t _neighborCount;
    };
} // namespace mrs::recommendation
