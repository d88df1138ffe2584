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

#include "JsonResponses.hpp"

#include <cmath>
#include <sstream>

#include <Wt/Json/Value.h>

#include "core/String.hpp"

namespace mrs::rest
{
    namespace
    {
        Wt::Json::Value toJsonValue(std::size_t value)
        {
            return Wt::Json::Value{ static_cast<long long>(value) };
        }

        Wt::Json::Value toJsonValue(const Wt::WDateTime& dateTime)
        {
            if (!dateTime.isValid())
                return Wt::Json::Value{};

            return Wt::Json::Value{ core::stringUtils::toISO8601String(dateTime) };
        }
    } // namespace

    Wt::Json::Array serializeResult(const recommendation::RecommendationResult& result)
    {
        Wt::Json::Array res;
        res.reserve(result.size());

        for (const recommendation::ScoredItem& scoredItem : result)
        {
            Wt::Json::Object entry;
            entry["movieId"] = Wt::Json::Value{ scoredItem.itemId };
            entry["score"] = Wt::Json::Value{ scoredItem.score };
            res.push_back(std::move(entry));
        }

        return res;
    }

    Wt::Json::Object createRecommendationResponse(const recommendation::RecommendationResult& result, const recommendation::UserId& userId, std::string_view algorithm, const Wt::WDateTime& generatedAt)
    {
        Wt::Json::Object res;
        res["recommendations"] = serializeResult(result);
        res["userId"] = Wt::Json::Value{ userId };
        res["algorithm"] = Wt::Json::Value{ std::string{ algorithm } };
        res["generatedAt"] = toJsonValue(generatedAt);

        return res;
    }

    Wt::Json::Object createPopularityResponse(const recommendation::RecommendationResult& result, const Wt::WDateTime& generatedAt)
    {
        Wt::Json::Object res;
        res["recommendations"] = serializeResult(result);
        res["algorithm"] = Wt::Json::Value{ std::string{ "popularity" } };
        res["generatedAt"] = toJsonValue(generatedAt);

        return res;
    }

    Wt::Json::Object createHealthResponse(const recommendation::Snapshot& snapshot, const Wt::WDateTime& now)
    {
        Wt::Json::Object dataStatus;
        dataStatus["ratings_count"] = toJsonValue(snapshot.ratings.size());
        dataStatus["movies_count"] = toJsonValue(snapshot.items.size());
        dataStatus["snapshot_version"] = Wt::Json::Value{ static_cast<long long>(snapshot.version) };
        dataStatus["last_update"] = toJsonValue(snapshot.createdAt);

        Wt::Json::Object res;
        res["status"] = Wt::Json::Value{ std::string{ "healthy" } };
        res["timestamp"] = toJsonValue(now);
        res["data_status"] = std::move(dataStatus);

        return res;
    }

    Wt::Json::Object createStatsResponse(const recommendation::SnapshotStats& stats)
    {
        Wt::Json::Object distribution;
        for (const auto& [score, count] : stats.ratingDistribution)
            distribution[formatScore(score)] = toJsonValue(count);

        Wt::Json::Object res;
        res["total_ratings"] = toJsonValue(stats.ratingCount);
        res["total_movies"] = toJsonValue(stats.itemCount);
        res["unique_users"] = toJsonValue(stats.userCount);
        res["rating_distribution"] = std::move(distribution);
        res["average_rating"] = Wt::Json::Value{ stats.averageRating };

        return res;
    }

    Wt::Json::Object createServiceDescriptionResponse()
    {
        Wt::Json::Object endpoints;
        endpoints["recommendations"] = Wt::Json::Value{ std::string{ "/recommend" } };
        endpoints["popular"] = Wt::Json::Value{ std::string{ "/popular" } };
        endpoints["health"] = Wt::Json::Value{ std::string{ "/health" } };
        endpoints["stats"] = Wt::Json::Value{ std::string{ "/stats" } };

        Wt::Json::Object res;
        res["message"] = Wt::Json::Value{ std::string{ "Movie Recommendation Service" } };
        res["version"] = Wt::Json::Value{ std::string{ "1.0.0" } };
        res["endpoints"] = std::move(endpoints);

        return res;
    }

    Wt::Json::Object createErrorResponse(std::string_view detail)
    {
        Wt::Json::Object res;
        res["detail"] = Wt::Json::Value{ std::string{ detail } };

        return res;
    }

    std::string formatScore(double score)
    {
        std::ostringstream oss;
        if (score == std::floor(score))
            oss << static_cast<long long>(score);
        else
            oss << score;

        return oss.str();
    }
} // namespace mrs::rest
