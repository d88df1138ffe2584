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

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string_view>

#include "dataset/Dataset.hpp"

namespace mrs::dataset
{
    class IDataSource
    {
    public:
        virtual ~IDataSource() = default;

        virtual std::string_view getName() const = 0;

        // Throws Exception on failure
        virtual Dataset load() = 0;
    };

    std::unique_ptr<IDataSource> createJsonFileDataSource(const std::filesystem::path& ratingsFile, const std::filesystem::path& itemsFile);

    static constexpr std::uint32_t defaultMockSeed{ 42 };
    std::unique_ptr<IDataSource> createMockDataSource(std::uint32_t seed = defaultMockSeed);
} // namespace mrs::dataset
