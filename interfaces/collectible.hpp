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

#ifndef INTERFACES_COLLECTIBLE_HPP
#define INTERFACES_COLLECTIBLE_HPP

#include "state.hpp"
#include "wrapper.hpp"

#include "assets/assetspec.hpp"
#include "contract/amount.hpp"

#include <vector>

namespace rgbif
{

/**
 * View of a contract through the RGB25 collectible-asset interface.
 * Unlike RGB20, the spec is stored as separate global state for name,
 * details and precision.
 */
class CollectibleContract : public InterfaceWrapper
{

public:

  explicit CollectibleContract (const ContractState& st)
    : InterfaceWrapper(IfaceStandard::RGB25, st)
  {}

  /**
   * Assembles the contract spec from its global state.  The article
   * is never set.
   */
  bool GetSpec (ContractSpec& out) const;

  bool GetTerms (ContractTerms& out) const;

  bool TotalIssuedSupply (Amount& out) const;

  /**
   * Returns the burned supply, which is zero if the contract is
   * not burnable.
   */
  bool TotalBurnedSupply (Amount& out) const;

  bool Allocations (const AssignmentsFilter& filter,
                    std::vector<FungibleAllocation>& out) const;

  bool Balance (const AssignmentsFilter& filter, Amount& out) const;

};

} // namespace rgbif

#endif // INTERFACES_COLLECTIBLE_HPP
