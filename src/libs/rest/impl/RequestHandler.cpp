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

#include "RequestHandler.hpp"

#include <cmath>
#include <functional>
#include <unordered_map>

#include <Wt/Json/Parser.h>
#include <Wt/Json/Value.h>
#include <Wt/WDateTime.h>

#include "core/ILogger.hpp"
#include "services/recommendation/Exception.hpp"
#include "services/recommendation/IRecommendationService.hpp"
#include "services/recommendation/Snapshot.hpp"

#include "Error.hpp"
#include "JsonResponses.hpp"
#include "ParameterParsing.hpp"

namespace mrs::rest
{
    namespace
    {
        constexpr recommendation::Algorithm defaultAlgorithm{ recommendation::Algorithm::Hybrid };

        std::string normalizePath(std::string_view path)
        {
            while (path.size() > 1 && path.back() == '/')
                path.remove_suffix(1);

            if (path.empty())
                return "/";

            return std::string{ path };
        }

        recommendation::Algorithm parseAlgorithmParameter(std::string_view value, std::string_view paramName)
        {
            const std::optional<recommendation::Algorithm> algorithm{ recommendation::parseAlgorithm(value) };
            if (!algorithm)
                throw BadParameterError{ paramName, "must be one of collaborative, content or hybrid" };

            return *algorithm;
        }

        void checkMethod(const ApiRequest& request, std::string_view method)
        {
            if (request.method != method)
                throw MethodNotAllowedError{};
        }
    } // namespace

    struct RequestHandler::RecommendParameters
    {
        recommendation::UserId userId;
        std::size_t limit{};
        recommendation::Algorithm algorithm{ defaultAlgorithm };
    };

    RequestHandler::RequestHandler(const ApiConfig& config, const recommendation::SnapshotStore& snapshotStore, const recommendation::IRecommendationService& recommendationService)
        : _config{ config }
        , _snapshotStore{ snapshotStore }
        , _recommendationService{ recommendationService }
    {
    }

    ApiResponse RequestHandler::handle(const ApiRequest& request) const
    {
        using HandlerFunc = Wt::Json::Object (RequestHandler::*)(const ApiRequest&) const;
        static const std::unordered_map<std::string, HandlerFunc> handlers{
            { "/recommend", &RequestHandler::handleRecommendRequest },
            { "/popular", &RequestHandler::handlePopularRequest },
            { "/health", &RequestHandler::handleHealthRequest },
            { "/stats", &RequestHandler::handleStatsRequest },
        };

        const std::string path{ normalizePath(request.path) };

        ApiResponse response;
        try
        {
            if (path == "/")
            {
                checkMethod(request, "GET");
                response.body = createServiceDescriptionResponse();
            }
            else if (auto itHandler{ handlers.find(path) }; itHandler != std::cend(handlers))
            {
                response.body = std::invoke(itHandler->second, this, request);
            }
            else
            {
                throw NotFoundError{};
            }
        }
        catch (const Error& e)
        {
            MRS_LOG(REST, DEBUG, "Request '" << request.method << " " << path << "' failed, status = " << e.getHttpStatus() << ", msg = '" << e.what() << "'");
            response.status = e.getHttpStatus();
            response.body = createErrorResponse(e.what());
        }
        catch (const recommendation::InvalidArgumentException& e)
        {
            MRS_LOG(REST, DEBUG, "Request '" << request.method << " " << path << "' rejected: " << e.what());
            response.status = 400;
            response.body = createErrorResponse(e.what());
        }
        catch (const std::exception& e)
        {
            MRS_LOG(REST, ERROR, "Error while processing request '" << request.method << " " << path << "', params = [" << parameterMapToDebugString(request.parameters) << "]: " << e.what());
            response.status = 500;
            response.body = createErrorResponse(e.what());
        }

        return response;
    }

    Wt::Json::Object RequestHandler::handleRecommendRequest(const ApiRequest& request) const
    {
        RecommendParameters parameters;
        if (request.method == "GET")
            parameters = parseRecommendQuery(request.parameters);
        else if (request.method == "POST")
            parameters = parseRecommendBody(request.body);
        else
            throw MethodNotAllowedError{};

        MRS_LOG(REST, DEBUG, "Computing " << recommendation::getAlgorithmName(parameters.algorithm) << " recommendations for user '" << parameters.userId << "', limit = " << parameters.limit);

        const recommendation::RecommendationResult result{ _recommendationService.computeRecommendations(parameters.userId, parameters.limit, parameters.algorithm) };
        return createRecommendationResponse(result, parameters.userId, recommendation::getAlgorithmName(parameters.algorithm), Wt::WDateTime::currentDateTime());
    }

    Wt::Json::Object RequestHandler::handlePopularRequest(const ApiRequest& request) const
    {
        checkMethod(request, "GET");

        const std::size_t limit{ checkLimit(getParameterAs<long long>(request.parameters, "limit").value_or(_config.defaultLimit), "limit") };

        const recommendation::RecommendationResult result{ _recommendationService.computePopularity(limit) };
        return createPopularityResponse(result, Wt::WDateTime::currentDateTime());
    }

    Wt::Json::Object RequestHandler::handleHealthRequest(const ApiRequest& request) const
    {
        checkMethod(request, "GET");

        return createHealthResponse(*_snapshotStore.getCurrent(), Wt::WDateTime::currentDateTime());
    }

    Wt::Json::Object RequestHandler::handleStatsRequest(const ApiRequest& request) const
    {
        checkMethod(request, "GET");

        return createStatsResponse(recommendation::computeSnapshotStats(*_snapshotStore.getCurrent()));
    }

    RequestHandler::RecommendParameters RequestHandler::parseRecommendQuery(const Wt::Http::ParameterMap& parameters) const
    {
        RecommendParameters res;

        res.userId = getMandatoryParameterAs<std::string>(parameters, "userId");
        if (res.userId.empty())
            throw BadParameterError{ "userId", "must not be empty" };

        res.limit = checkLimit(getParameterAs<long long>(parameters, "limit").value_or(_config.defaultLimit), "limit");

        const std::optional<std::string> type{ getParameterAs<std::string>(parameters, "type") };
        res.algorithm = type ? parseAlgorithmParameter(*type, "type") : defaultAlgorithm;

        return res;
    }

    RequestHandler::RecommendParameters RequestHandler::parseRecommendBody(const std::string& body) const
    {
        Wt::Json::Value rootValue;
        try
        {
            Wt::Json::parse(body, rootValue);
        }
        catch (const Wt::Json::ParseError& e)
        {
            throw BadRequestError{ std::string{ "Invalid JSON body: " } + e.what() };
        }

        if (rootValue.type() != Wt::Json::Type::Object)
            throw BadRequestError{ "Invalid JSON body: expected an object" };

        const Wt::Json::Object& root{ static_cast<const Wt::Json::Object&>(rootValue) };

        RecommendParameters res;

        if (root.type("user_id") == Wt::Json::Type::Null)
            throw RequiredParameterMissingError{ "user_id" };
        if (root.type("user_id") != Wt::Json::Type::String)
            throw BadParameterError{ "user_id", "must be a string" };
        res.userId = static_cast<std::string>(root.get("user_id"));
        if (res.userId.empty())
            throw BadParameterError{ "user_id", "must not be empty" };

        res.limit = _config.defaultLimit;
        switch (root.type("limit"))
        {
        case Wt::Json::Type::Null:
            break;

        case Wt::Json::Type::Number:
            {
                const double limit{ static_cast<double>(root.get("limit")) };
                if (!std::isfinite(limit) || limit != std::floor(limit))
                    throw BadParameterError{ "limit", "must be an integer" };
                // range checked before the conversion, which is undefined for out of range values
                if (limit < 1 || limit > static_cast<double>(_config.maxLimit))
                    throw BadParameterError{ "limit", "must be in range [1, " + std::to_string(_config.maxLimit) + "]" };
                res.limit = checkLimit(static_cast<long long>(limit), "limit");
                break;
            }

        default:
            throw BadParameterError{ "limit", "must be an integer" };
        }

        res.algorithm = defaultAlgorithm;
        switch (root.type("recommendation_type"))
        {
        case Wt::Json::Type::Null:
            break;

        case Wt::Json::Type::String:
            res.algorithm = parseAlgorithmParameter(static_cast<std::string>(root.get("recommendation_type")), "recommendation_type");
            break;

        default:
            throw BadParameterError{ "recommendation_type", "must be a string" };
        }

        return res;
    }

    std::size_t RequestHandler::checkLimit(long long limit, std::string_view paramName) const
    {
        if (limit < 1 || static_cast<unsigned long long>(limit) > _config.maxLimit)
            throw BadParameterError{ paramName, "must be in range [1, " + std::to_string(_config.maxLimit) + "]" };

        return static_cast<std::size_t>(limit);
    }
} // namespace mrs::rest
