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

#include "wrapper.hpp"

#include <glog/logging.h>

namespace rgbif
{

InterfaceWrapper::InterfaceWrapper (const IfaceStandard s,
                                    const ContractState& st)
  : standard(s), state(st)
{}

void
InterfaceWrapper::CheckStateName (const std::string& name,
                                  const proto::StateKind kind) const
{
  const TypeLib lib;
  const auto* def = lib.StateOrNull (standard, name);
  CHECK (def != nullptr)
      << "Interface " << standard << " does not define state " << name;
  CHECK_EQ (def->kind (), kind)
      << "State " << name << " of " << standard << " has a different kind";
}

bool
InterfaceWrapper::SumGlobalAmounts (const std::string& name,
                                    const bool required, Amount& out) const
{
  std::vector<Amount> values;
  if (!DecodeAllGlobal (name, required, values))
    return false;

  out = SumAmounts (values);
  return true;
}

bool
InterfaceWrapper::GetFungibleAllocations (
    const std::string& name, const AssignmentsFilter& filter,
    std::vector<FungibleAllocation>& out) const
{
  CheckStateName (name, proto::FUNGIBLE);

  if (!state.GetFungible (name, filter, out))
    {
      LOG (WARNING)
          << standard << " contract has no fungible state " << name;
      return false;
    }

  return true;
}

bool
InterfaceWrapper::GetNftAllocations (
    const std::string& name, const AssignmentsFilter& filter,
    std::vector<NftAllocation>& out) const
{
  CheckStateName (name, proto::STRUCTURED);

  if (!state.GetNfts (name, filter, out))
    {
      LOG (WARNING)
          << standard << " contract has no structured state " << name;
      return false;
    }

  return true;
}

} // namespace rgbif
