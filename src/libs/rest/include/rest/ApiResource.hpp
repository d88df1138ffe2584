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

#include <memory>

#include <Wt/WResource.h>

namespace mrs::core
{
    class IConfig;
}

namespace mrs::recommendation
{
    class IRecommendationService;
    class SnapshotStore;
} // namespace mrs::recommendation

namespace mrs::rest
{
    // JSON API, dispatched on the path info of the requests
    std::unique_ptr<Wt::WResource> createApiResource(core::IConfig& config, const recommendation::SnapshotStore& snapshotStore, const recommendation::IRecommendationService& recommendationService);
} // namespace mrs::rest
