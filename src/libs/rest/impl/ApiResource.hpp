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

#include <Wt/Http/Request.h>
#include <Wt/Http/Response.h>
#include <Wt/WResource.h>

#include "RequestHandler.hpp"

namespace mrs::rest
{
    class ApiResource final : public Wt::WResource
    {
    public:
        ApiResource(const ApiConfig& config, const recommendation::SnapshotStore& snapshotStore, const recommendation::IRecommendationService& recommendationService);
        ~ApiResource() override;
        ApiResource(const ApiResource&) = delete;
        ApiResource& operator=(const ApiResource&) = delete;

    private:
        void handleRequest(const Wt::Http::Request& request, Wt::Http::Response& response) override;

        const RequestHandler _requestHandler;
    };
} // namespace mrs::rest
