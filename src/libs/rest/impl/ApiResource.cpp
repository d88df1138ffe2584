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

#include "ApiResource.hpp"

#include <atomic>
#include <iterator>

#include <Wt/Json/Serializer.h>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "rest/ApiResource.hpp"

#include "ParameterParsing.hpp"

namespace mrs::rest
{
    std::unique_ptr<Wt::WResource> createApiResource(core::IConfig& config, const recommendation::SnapshotStore& snapshotStore, const recommendation::IRecommendationService& recommendationService)
    {
        return std::make_unique<ApiResource>(readApiConfig(config), snapshotStore, recommendationService);
    }

    ApiResource::ApiResource(const ApiConfig& config, const recommendation::SnapshotStore& snapshotStore, const recommendation::IRecommendationService& recommendationService)
        : _requestHandler{ config, snapshotStore, recommendationService }
    {
        MRS_LOG(REST, INFO, "API max limit = " << config.maxLimit);
    }

    ApiResource::~ApiResource()
    {
        beingDeleted();
    }

    void ApiResource::handleRequest(const Wt::Http::Request& request, Wt::Http::Response& response)
    {
        static std::atomic<std::size_t> curRequestId{};
        const std::size_t requestId{ curRequestId++ };

        MRS_LOG(REST, DEBUG, "Handling request " << requestId << " '" << request.method() << " " << request.pathInfo() << "', params = " << parameterMapToDebugString(request.getParameterMap()));

        ApiRequest apiRequest{
            .method = request.method(),
            .path = request.pathInfo(),
            .parameters = request.getParameterMap(),
            .body = {},
        };
        if (apiRequest.method == "POST")
            apiRequest.body.assign(std::istreambuf_iterator<char>{ request.in() }, std::istreambuf_iterator<char>{});

        const ApiResponse apiResponse{ _requestHandler.handle(apiRequest) };

        response.setStatus(apiResponse.status);
        response.setMimeType("application/json");
        response.out() << Wt::Json::serialize(apiResponse.body);

        MRS_LOG(REST, DEBUG, "Request " << requestId << " handled, status = " << apiResponse.status);
    }
} // namespace mrs::rest
