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

#ifndef INTERFACES_UNIQUE_HPP
#define INTERFACES_UNIQUE_HPP

#include "state.hpp"
#include "wrapper.hpp"

#include "assets/assetspec.hpp"
#include "assets/media.hpp"
#include "assets/nft.hpp"

#include <vector>

namespace rgbif
{

/**
 * View of a contract through the RGB21 unique-asset interface.
 */
class UniqueContract : public InterfaceWrapper
{

public:

  explicit UniqueContract (const ContractState& st)
    : InterfaceWrapper(IfaceStandard::RGB21, st)
  {}

  bool GetSpec (AssetSpec& out) const;
  bool GetTerms (ContractTerms& out) const;

  /**
   * Returns the specs of all tokens defined by the contract.
   */
  bool Tokens (std::vector<NftSpec>& out) const;

  /**
   * Looks up the spec of a single token.  Returns false if the token
   * does not exist or the state is invalid.
   */
  bool Token (TokenIndex index, NftSpec& out) const;

  /**
   * Returns all engravings.  Contracts that are not engravable have none.
   */
  bool Engravings (std::vector<NftEngraving>& out) const;

  bool AttachmentTypes (std::vector<AttachmentType>& out) const;

  /**
   * Returns the token allocations matching the filter.
   */
  bool Allocations (const AssignmentsFilter& filter,
                    std::vector<NftAllocation>& out) const;

  /**
   * Sums up the owned fractions of a particular token over all allocations
   * matching the filter.
   */
  bool OwnedFractionOf (TokenIndex index, const AssignmentsFilter& filter,
                        OwnedFraction& out) const;

};

} // namespace rgbif

#endif // INTERFACES_UNIQUE_HPP
