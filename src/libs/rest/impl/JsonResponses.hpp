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

#include <string>
#include <string_view>

#include <Wt/Json/Array.h>
#include <Wt/Json/Object.h>
#include <Wt/WDateTime.h>

#include "services/recommendation/Snapshot.hpp"
#include "services/recommendation/Types.hpp"

namespace mrs::rest
{
    // [{"movieId", "score"}...], in result order
    Wt::Json::Array serializeResult(const recommendation::RecommendationResult& result);

    Wt::Json::Object createRecommendationResponse(const recommendation::RecommendationResult& result, const recommendation::UserId& userId, std::string_view algorithm, const Wt::WDateTime& generatedAt);
    Wt::Json::Object createPopularityResponse(const recommendation::RecommendationResult& result, const Wt::WDateTime& generatedAt);
    Wt::Json::Object createHealthResponse(const recommendation::Snapshot& snapshot, const Wt::WDateTime& now);
    Wt::Json::Object createStatsResponse(const recommendation::SnapshotStats& stats);
    Wt::Json::Object createServiceDescriptionResponse();
    Wt::Json::Object createErrorResponse(std::string_view detail);

    // "5" for 5, "3.5" for 3.5
    std::string formatScore(double score);
} // namespace mrs::rest
