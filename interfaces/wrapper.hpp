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

#ifndef INTERFACES_WRAPPER_HPP
#define INTERFACES_WRAPPER_HPP

#include "state.hpp"

#include "contract/amount.hpp"
#include "proto/typelib.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rgbif
{

/**
 * Base class for the typed views of a contract's state through one of the
 * standard interfaces.  It provides the shared logic for decoding global
 * state.  All state names queried must be part of the interface definition
 * in the standard registry.
 */
class InterfaceWrapper
{

private:

  /** The interface this is a view for.  */
  const IfaceStandard standard;

  /**
   * Asserts that the interface defines state with the given name
   * and kind.
   */
  void CheckStateName (const std::string& name, proto::StateKind kind) const;

protected:

  /** The underlying contract state.  */
  const ContractState& state;

  explicit InterfaceWrapper (IfaceStandard s, const ContractState& st);

  /**
   * Decodes the single value of a global state that must be present
   * exactly once.
   */
  template <typename T>
    bool DecodeSingleGlobal (const std::string& name, T& out) const;

  /**
   * Decodes a global state that may be present at most once.  If the
   * state is not defined or has no value, out is reset.
   */
  template <typename T>
    bool DecodeOptionalGlobal (const std::string& name,
                               std::optional<T>& out) const;

  /**
   * Decodes all values of a global state.  If required is false and the
   * contract does not define the state, the result is empty.
   */
  template <typename T>
    bool DecodeAllGlobal (const std::string& name, bool required,
                          std::vector<T>& out) const;

  /**
   * Sums up all Amount values of a global state with saturation.
   */
  bool SumGlobalAmounts (const std::string& name, bool required,
                         Amount& out) const;

  /**
   * Queries fungible allocations of the given owned state.
   */
  bool GetFungibleAllocations (const std::string& name,
                               const AssignmentsFilter& filter,
                               std::vector<FungibleAllocation>& out) const;

  /**
   * Queries Nft allocations of the given owned state.
   */
  bool GetNftAllocations (const std::string& name,
                          const AssignmentsFilter& filter,
                          std::vector<NftAllocation>& out) const;

public:

  virtual ~InterfaceWrapper () = default;

  InterfaceWrapper (const InterfaceWrapper&) = delete;
  void operator= (const InterfaceWrapper&) = delete;

  IfaceStandard
  GetStandard () const
  {
    return standard;
  }

};

} // namespace rgbif

#include "wrapper.tpp"

#endif // INTERFACES_WRAPPER_HPP
