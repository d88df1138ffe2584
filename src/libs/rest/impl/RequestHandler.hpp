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

#include <Wt/Http/Request.h>
#include <Wt/Json/Object.h>

#include "ApiConfig.hpp"

namespace mrs::recommendation
{
    class IRecommendationService;
    class SnapshotStore;
} // namespace mrs::recommendation

namespace mrs::rest
{
    struct ApiRequest
    {
        std::string method;
        std::string path; // relative to the deployment path of the resource
        Wt::Http::ParameterMap parameters;
        std::string body;
    };

    struct ApiResponse
    {
        int status{ 200 };
        Wt::Json::Object body;
    };

    class RequestHandler
    {
    public:
        RequestHandler(const ApiConfig& config, const recommendation::SnapshotStore& snapshotStore, const recommendation::IRecommendationService& recommendationService);

        // Errors are reported in the response, with a {"detail"} body
        ApiResponse handle(const ApiRequest& request) const;

    private:
        Wt::Json::Object handleRecommendRequest(const ApiRequest& request) const;
        Wt::Json::Object handlePopularRequest(const ApiRequest& request) const;
        Wt::Json::Object handleHealthRequest(const ApiRequest& request) const;
        Wt::Json::Object handleStatsRequest(const ApiRequest& request) const;

        struct RecommendParameters;
        RecommendParameters parseRecommendQuery(const Wt::Http::ParameterMap& parameters) const;
        RecommendParameters parseRecommendBody(const std::string& body) const;
        std::size_t checkLimit(long long limit, std::string_view paramName) const;

        const ApiConfig _config;
        const recommendation::SnapshotStore& _snapshotStore;
        const recommendation::IRecommendationService& _recommendationService;
    };
} // namespace mrs::rest
