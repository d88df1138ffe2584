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

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <random>

namespace mrs::core::random
{
    using RandGenerator = std::mt19937;

    RandGenerator& getRandGenerator();
    RandGenerator createSeededGenerator(std::uint_fast32_t seed);

    template<typename T>
    T getRandom(T min, T max, RandGenerator& generator = getRandGenerator())
    {
        std::uniform_int_distribution<T> dist{ min, max };
        return dist(generator);
    }

    template<typename Container>
    void shuffleContainer(Container& container, RandGenerator& generator = getRandGenerator())
    {
        std::shuffle(std::begin(container), std::end(container), generator);
    }

    template<typename Container>
    typename Container::const_iterator pickRandom(const Container& container, RandGenerator& generator = getRandGenerator())
    {
        if (container.empty())
            return std::cend(container);

        return std::next(std::cbegin(container), getRandom<std::size_t>(0, container.size() - 1, generator));
    }
} // namespace mrs::core::random
