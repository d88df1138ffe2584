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

#include <cassert>
#include <cstddef>
#include <span>
#include <vector>

namespace mrs::recommendation
{
    // Dense row-major matrix
    template<typename T>
    class Matrix
    {
    public:
        Matrix() = default;

        Matrix(std::size_t rowCount, std::size_t columnCount, T value = T{})
            : _rowCount{ rowCount }
            , _columnCount{ columnCount }
        {
            _values.resize(_rowCount * _columnCount, value);
        }

        std::size_t getRowCount() const { return _rowCount; }
        std::size_t getColumnCount() const { return _columnCount; }
        bool empty() const { return _values.empty(); }

        T& get(std::size_t row, std::size_t column)
        {
            assert(row < _rowCount);
            assert(column < _columnCount);
            return _values[row * _columnCount + column];
        }

        const T& get(std::size_t row, std::size_t column) const
        {
            assert(row < _rowCount);
            assert(column < _columnCount);
            return _values[row * _columnCount + column];
        }

        std::span<const T> getRow(std::size_t row) const
        {
            assert(row < _rowCount);
            return std::span<const T>{ _values.data() + row * _columnCount, _columnCount };
        }

    private:
        std::size_t _rowCount{};
        std::size_t _columnCount{};
        std::vector<T> _values;
    };
} // namespace mrs::recommendation
