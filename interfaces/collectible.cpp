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

#include "collectible.hpp"

namespace rgbif
{

bool
CollectibleContract::GetSpec (ContractSpec& out) const
{
  ContractSpec res;
  if (!DecodeSingleGlobal ("name", res.name)
        || !DecodeOptionalGlobal ("details", res.details)
        || !DecodeSingleGlobal ("precision", res.precision))
    return false;

  out = res;
  return true;
}

bool
CollectibleContract::GetTerms (ContractTerms& out) const
{
  return DecodeSingleGlobal ("terms", out);
}

bool
CollectibleContract::TotalIssuedSupply (Amount& out) const
{
  return SumGlobalAmounts ("issuedSupply", true, out);
}

bool
CollectibleContract::TotalBurnedSupply (Amount& out) const
{
  return SumGlobalAmounts ("burnedSupply", false, out);
}

bool
CollectibleContract::Allocations (const AssignmentsFilter& filter,
                                  std::vector<FungibleAllocation>& out) const
{
  return GetFungibleAllocations ("assetOwner", filter, out);
}

bool
CollectibleContract::Balance (const AssignmentsFilter& filter,
                              Amount& out) const
{
  std::vector<FungibleAllocation> allocs;
  if (!Allocations (filter, allocs))
    return false;

  Amount res;
  for (const auto& a : allocs)
    res.SaturatingAddAssign (a.state);

  out = res;
  return true;
}

} // namespace rgbif
