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

#include "unique.hpp"

#include <glog/logging.h>

#include <utility>

namespace rgbif
{

bool
UniqueContract::GetSpec (AssetSpec& out) const
{
  return DecodeSingleGlobal ("spec", out);
}

bool
UniqueContract::GetTerms (ContractTerms& out) const
{
  return DecodeSingleGlobal ("terms", out);
}

bool
UniqueContract::Tokens (std::vector<NftSpec>& out) const
{
  return DecodeAllGlobal ("tokens", true, out);
}

bool
UniqueContract::Token (const TokenIndex index, NftSpec& out) const
{
  std::vector<NftSpec> tokens;
  if (!Tokens (tokens))
    return false;

  for (auto& t : tokens)
    if (t.index == index)
      {
        out = std::move (t);
        return true;
      }

  VLOG (1) << "Token " << index << " does not exist";
  return false;
}

bool
UniqueContract::Engravings (std::vector<NftEngraving>& out) const
{
  return DecodeAllGlobal ("engravings", false, out);
}

bool
UniqueContract::AttachmentTypes (std::vector<AttachmentType>& out) const
{
  return DecodeAllGlobal ("attachmentTypes", true, out);
}

bool
UniqueContract::Allocations (const AssignmentsFilter& filter,
                             std::vector<NftAllocation>& out) const
{
  return GetNftAllocations ("assetOwner", filter, out);
}

bool
UniqueContract::OwnedFractionOf (const TokenIndex index,
                                 const AssignmentsFilter& filter,
                                 OwnedFraction& out) const
{
  std::vector<NftAllocation> allocs;
  if (!Allocations (filter, allocs))
    return false;

  OwnedFraction res;
  for (const auto& a : allocs)
    if (a.state.tokenIndex == index)
      res.SaturatingAddAssign (a.state.fraction);

  out = res;
  return true;
}

} // namespace rgbif
