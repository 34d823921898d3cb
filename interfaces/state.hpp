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

#ifndef INTERFACES_STATE_HPP
#define INTERFACES_STATE_HPP

#include "assets/nft.hpp"
#include "assets/reserves.hpp"
#include "contract/amount.hpp"
#include "encoding/strict.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace rgbif
{

/**
 * A fungible amount assigned to some single-use seal.
 */
struct FungibleAllocation
{

  Outpoint seal;
  Amount state;

};

bool operator== (const FungibleAllocation& a, const FungibleAllocation& b);

/**
 * An Nft assigned to some single-use seal.
 */
struct NftAllocation
{

  Outpoint seal;
  Nft state;

};

bool operator== (const NftAllocation& a, const NftAllocation& b);

/**
 * Filter deciding which owned state a query should return, e.g. only
 * the state owned by a particular wallet.
 */
class AssignmentsFilter
{

public:

  AssignmentsFilter () = default;
  virtual ~AssignmentsFilter () = default;

  /**
   * Returns true if state assigned to the given seal should be included.
   */
  virtual bool Includes (const Outpoint& seal) const = 0;

};

/**
 * Filter that includes all state.
 */
class AllAssignments : public AssignmentsFilter
{

public:

  bool
  Includes (const Outpoint& seal) const override
  {
    return true;
  }

};

/**
 * Filter that includes state assigned to one of a fixed set of seals.
 */
class SealsFilter : public AssignmentsFilter
{

private:

  std::set<Outpoint> seals;

public:

  explicit SealsFilter (const std::set<Outpoint>& s)
    : seals(s)
  {}

  bool
  Includes (const Outpoint& seal) const override
  {
    return seals.count (seal) > 0;
  }

};

/**
 * Read access to the state of a contract, as provided by the external
 * validation engine.  Global state values are returned strict-encoded,
 * the interface wrappers decode them into the standard types.
 */
class ContractState
{

protected:

  ContractState () = default;

public:

  virtual ~ContractState () = default;

  /**
   * Returns the names of all state transitions the contract supports.
   */
  virtual std::set<std::string> GetTransitions () const = 0;

  /**
   * Returns all values (strict-encoded) of the global state with the
   * given name.  If the contract does not define that state at all, false
   * is returned.
   */
  virtual bool GetGlobal (const std::string& name,
                          std::vector<std::string>& values) const = 0;

  /**
   * Returns all fungible allocations of the given owned state that
   * match the filter.  Returns false if the contract does not define
   * fungible state with that name.
   */
  virtual bool GetFungible (const std::string& name,
                            const AssignmentsFilter& filter,
                            std::vector<FungibleAllocation>& out) const = 0;

  /**
   * Returns all Nft allocations of the given owned state that match
   * the filter.  Returns false if the contract does not define such
   * structured state.
   */
  virtual bool GetNfts (const std::string& name,
                        const AssignmentsFilter& filter,
                        std::vector<NftAllocation>& out) const = 0;

};

/**
 * Contract state held fully in memory.  This is used for tooling and tests,
 * where the state is built up explicitly rather than coming from
 * a validated contract.
 */
class MemoryContractState : public ContractState
{

private:

  std::set<std::string> transitions;
  std::map<std::string, std::vector<std::string>> global;
  std::map<std::string, std::vector<FungibleAllocation>> fungible;
  std::map<std::string, std::vector<NftAllocation>> nfts;

public:

  MemoryContractState () = default;

  MemoryContractState (const MemoryContractState&) = delete;
  void operator= (const MemoryContractState&) = delete;

  void AddTransition (const std::string& name);

  /**
   * Declares global state with the given name, without adding any values.
   */
  void DeclareGlobal (const std::string& name);

  /**
   * Appends a raw strict-encoded value to the global state.
   */
  void AddRawGlobal (const std::string& name, const std::string& value);

  /**
   * Strict-encodes and appends a value to the global state.
   */
  template <typename T>
    void
    AddGlobal (const std::string& name, const T& value)
  {
    AddRawGlobal (name, StrictSerialise (value));
  }

  void DeclareFungible (const std::string& name);
  void AddFungible (const std::string& name, const Outpoint& seal,
                    Amount amount);

  void DeclareNfts (const std::string& name);
  void AddNft (const std::string& name, const Outpoint& seal, const Nft& nft);

  std::set<std::string> GetTransitions () const override;
  bool GetGlobal (const std::string& name,
                  std::vector<std::string>& values) const override;
  bool GetFungible (const std::string& name, const AssignmentsFilter& filter,
                    std::vector<FungibleAllocation>& out) const override;
  bool GetNfts (const std::string& name, const AssignmentsFilter& filter,
                std::vector<NftAllocation>& out) const override;

};

} // namespace rgbif

#endif // INTERFACES_STATE_HPP
