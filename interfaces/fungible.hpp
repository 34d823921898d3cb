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

#ifndef INTERFACES_FUNGIBLE_HPP
#define INTERFACES_FUNGIBLE_HPP

#include "features.hpp"
#include "state.hpp"
#include "wrapper.hpp"

#include "assets/assetspec.hpp"
#include "contract/amount.hpp"

#include <vector>

namespace rgbif
{

/**
 * View of a contract through the RGB20 fungible-asset interface.
 */
class FungibleContract : public InterfaceWrapper
{

public:

  explicit FungibleContract (const ContractState& st)
    : InterfaceWrapper(IfaceStandard::RGB20, st)
  {}

  /**
   * Determines the features of the asset from the transitions its
   * contract supports.
   */
  bool GetFeatures (Features& out) const;

  bool GetSpec (AssetSpec& out) const;
  bool GetTerms (ContractTerms& out) const;

  /**
   * Returns the sum of all issuances, including the genesis.
   */
  bool TotalIssuedSupply (Amount& out) const;

  /**
   * Returns the maximum supply that may ever be issued.  If the contract
   * does not set one, this is the issued supply.
   */
  bool MaxSupply (Amount& out) const;

  /**
   * Returns the sum of all burned supply.  For assets that are not
   * burnable, this is zero.
   */
  bool TotalBurnedSupply (Amount& out) const;

  /**
   * Returns the sum of all replaced supply (zero if not replaceable).
   */
  bool TotalReplacedSupply (Amount& out) const;

  /**
   * Returns the supply currently in circulation, i.e. issued minus burned
   * supply (saturating at zero).
   */
  bool TotalSupply (Amount& out) const;

  /**
   * Returns the allocations of the asset matching the filter.
   */
  bool Allocations (const AssignmentsFilter& filter,
                    std::vector<FungibleAllocation>& out) const;

  /**
   * Returns the allocations of rights to issue further supply.  This
   * is only valid for inflatable assets.
   */
  bool InflationAllowance (const AssignmentsFilter& filter,
                           std::vector<FungibleAllocation>& out) const;

  /**
   * Returns the total amount owned by seals matching the filter.
   */
  bool Balance (const AssignmentsFilter& filter, Amount& out) const;

};

} // namespace rgbif

#endif // INTERFACES_FUNGIBLE_HPP
