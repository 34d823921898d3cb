/*
    Standard RGB contract interfaces
    Copyright (C) 2025  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#include "amount.hpp"

#include <benchmark/benchmark.h>

#include <glog/logging.h>

#include <string>
#include <vector>

namespace rgbif
{
namespace
{

/**
 * Benchmarks summing up a list of allocations, as done when computing
 * balances and supplies.  The number of values is passed as argument.
 */
void
AmountSum (benchmark::State& state)
{
  const size_t num = state.range (0);

  std::vector<Amount> values;
  for (size_t i = 0; i < num; ++i)
    values.push_back (Amount (i * 1'000));

  for (auto _ : state)
    {
      const Amount sum = SumAmounts (values);
      benchmark::DoNotOptimize (sum);
    }
}
BENCHMARK (AmountSum)
  ->Args ({10})
  ->Args ({1'000})
  ->Args ({100'000});

/**
 * Benchmarks formatting and parsing of decimal amounts under
 * the default precision.
 */
void
AmountDecimalString (benchmark::State& state)
{
  const Amount a(123'456'789'012);

  for (auto _ : state)
    {
      const std::string str = a.ToDecimalString (DEFAULT_PRECISION);
      Amount parsed;
      CHECK (Amount::FromDecimalString (str, DEFAULT_PRECISION, parsed));
      benchmark::DoNotOptimize (parsed);
    }
}
BENCHMARK (AmountDecimalString);

} // anonymous namespace
} // namespace rgbif
