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

#include "fungible.hpp"

#include <glog/logging.h>

namespace rgbif
{

bool
FungibleContract::GetFeatures (Features& out) const
{
  return FeaturesFromTransitions (state.GetTransitions (), out);
}

bool
FungibleContract::GetSpec (AssetSpec& out) const
{
  return DecodeSingleGlobal ("spec", out);
}

bool
FungibleContract::GetTerms (ContractTerms& out) const
{
  return DecodeSingleGlobal ("terms", out);
}

bool
FungibleContract::TotalIssuedSupply (Amount& out) const
{
  return SumGlobalAmounts ("issuedSupply", true, out);
}

bool
FungibleContract::MaxSupply (Amount& out) const
{
  std::optional<Amount> max;
  if (!DecodeOptionalGlobal ("maxSupply", max))
    return false;

  if (max.has_value ())
    {
      out = *max;
      return true;
    }

  return TotalIssuedSupply (out);
}

bool
FungibleContract::TotalBurnedSupply (Amount& out) const
{
  return SumGlobalAmounts ("burnedSupply", false, out);
}

bool
FungibleContract::TotalReplacedSupply (Amount& out) const
{
  return SumGlobalAmounts ("replacedSupply", false, out);
}

bool
FungibleContract::TotalSupply (Amount& out) const
{
  Amount issued, burned;
  if (!TotalIssuedSupply (issued) || !TotalBurnedSupply (burned))
    return false;

  if (burned > issued)
    LOG (WARNING)
        << "Burned supply " << burned
        << " exceeds issued supply " << issued;

  out = issued.SaturatingSub (burned);
  return true;
}

bool
FungibleContract::Allocations (const AssignmentsFilter& filter,
                               std::vector<FungibleAllocation>& out) const
{
  return GetFungibleAllocations ("assetOwner", filter, out);
}

bool
FungibleContract::InflationAllowance (
    const AssignmentsFilter& filter,
    std::vector<FungibleAllocation>& out) const
{
  return GetFungibleAllocations ("inflationAllowance", filter, out);
}

bool
FungibleContract::Balance (const AssignmentsFilter& filter, Amount& out) const
{
  std::vector<FungibleAllocation> allocs;
  if (!Allocations (filter, allocs))
    return false;

  std::vector<Amount> amounts;
  for (const auto& a : allocs)
    amounts.push_back (a.state);

  out = SumAmounts (amounts);
  return true;
}

} // namespace rgbif
