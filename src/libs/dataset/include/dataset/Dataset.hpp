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

#include <string_view>
#include <vector>

#include "services/recommendation/Types.hpp"

namespace mrs::dataset
{
    struct Dataset
    {
        std::vector<recommendation::Rating> ratings;
        std::vector<recommendation::Item> items;
    };

    // Input is a JSON array of objects
    // Invalid records are skipped, throws Exception if the document itself cannot be parsed
    std::vector<recommendation::Rating> parseRatings(std::string_view json);
    std::vector<recommendation::Item> parseItems(std::string_view json);
} // namespace mrs::dataset
