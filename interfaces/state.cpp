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

#include "state.hpp"

#include <glog/logging.h>

namespace rgbif
{

bool
operator== (const FungibleAllocation& a, const FungibleAllocation& b)
{
  return a.seal == b.seal && a.state == b.state;
}

bool
operator== (const NftAllocation& a, const NftAllocation& b)
{
  return a.seal == b.seal && a.state == b.state;
}

/* ************************************************************************** */

namespace
{

/**
 * Filters the allocations stored for a given name in one of the maps.
 */
template <typename Alloc>
  bool
  FilterAllocations (
      const std::map<std::string, std::vector<Alloc>>& allocs,
      const std::string& name, const AssignmentsFilter& filter,
      std::vector<Alloc>& out)
{
  const auto mit = allocs.find (name);
  if (mit == allocs.end ())
    return false;

  out.clear ();
  for (const auto& a : mit->second)
    if (filter.Includes (a.seal))
      out.push_back (a);

  return true;
}

} // anonymous namespace

void
MemoryContractState::AddTransition (const std::string& name)
{
  transitions.insert (name);
}

void
MemoryContractState::DeclareGlobal (const std::string& name)
{
  global[name];
}

void
MemoryContractState::AddRawGlobal (const std::string& name,
                                   const std::string& value)
{
  global[name].push_back (value);
}

void
MemoryContractState::DeclareFungible (const std::string& name)
{
  fungible[name];
}

void
MemoryContractState::AddFungible (const std::string& name,
                                  const Outpoint& seal, const Amount amount)
{
  FungibleAllocation alloc;
  alloc.seal = seal;
  alloc.state = amount;
  fungible[name].push_back (alloc);
}

void
MemoryContractState::DeclareNfts (const std::string& name)
{
  nfts[name];
}

void
MemoryContractState::AddNft (const std::string& name, const Outpoint& seal,
                             const Nft& nft)
{
  NftAllocation alloc;
  alloc.seal = seal;
  alloc.state = nft;
  nfts[name].push_back (alloc);
}

std::set<std::string>
MemoryContractState::GetTransitions () const
{
  return transitions;
}

bool
MemoryContractState::GetGlobal (const std::string& name,
                                std::vector<std::string>& values) const
{
  const auto mit = global.find (name);
  if (mit == global.end ())
    {
      VLOG (1) << "No global state " << name << " in contract";
      return false;
    }

  values = mit->second;
  return true;
}

bool
MemoryContractState::GetFungible (const std::string& name,
                                  const AssignmentsFilter& filter,
                                  std::vector<FungibleAllocation>& out) const
{
  return FilterAllocations (fungible, name, filter, out);
}

bool
MemoryContractState::GetNfts (const std::string& name,
                              const AssignmentsFilter& filter,
                              std::vector<NftAllocation>& out) const
{
  return FilterAllocations (nfts, name, filter, out);
}

} // namespace rgbif
