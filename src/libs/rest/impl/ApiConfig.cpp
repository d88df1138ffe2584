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

#include "ApiConfig.hpp"

#include <algorithm>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"

namespace mrs::rest
{
    ApiConfig readApiConfig(core::IConfig& config)
    {
        ApiConfig res;

        res.maxLimit = config.getULong("api-max-limit", res.maxLimit);
        if (res.maxLimit < 1)
            throw core::MrsException{ "api-max-limit must be at least 1" };

        res.defaultLimit = std::min(res.defaultLimit, res.maxLimit);

        return res;
    }
} // namespace mrs::rest
