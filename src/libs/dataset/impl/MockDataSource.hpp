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

#include "dataset/IDataSource.hpp"

namespace mrs::dataset
{
    // Deterministic for a given seed
    class MockDataSource final : public IDataSource
    {
    public:
        MockDataSource(std::uint32_t seed);
        ~MockDataSource() override = default;
        MockDataSource(const MockDataSource&) = delete;
        MockDataSource& operator=(const MockDataSource&) = delete;

        static constexpr std::size_t itemCount{ 50 };
        static constexpr std::size_t userCount{ 20 };
        static constexpr std::size_t minRatingCountPerUser{ 10 };
        static constexpr std::size_t maxRatingCountPerUser{ 30 };

    private:
        std::string_view getName() const override { return "mock"; }
        Dataset load() override;

        const std::uint32_t _seed;
    };
} // namespace mrs::dataset
