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

#include <filesystem>

#include "dataset/IDataSource.hpp"

namespace mrs::dataset
{
    class JsonFileDataSource final : public IDataSource
    {
    public:
        JsonFileDataSource(const std::filesystem::path& ratingsFile, const std::filesystem::path& itemsFile);
        ~JsonFileDataSource() override = default;
        JsonFileDataSource(const JsonFileDataSource&) = delete;
        JsonFileDataSource& operator=(const JsonFileDataSource&) = delete;

    private:
        std::string_view getName() const override { return "json"; }
        Dataset load() override;

        const std::filesystem::path _ratingsFile;
        const std::filesystem::path _itemsFile;
    };
} // namespace mrs::dataset
