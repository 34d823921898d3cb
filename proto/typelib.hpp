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

#ifndef PROTO_TYPELIB_HPP
#define PROTO_TYPELIB_HPP

#include "typelib.pb.h"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace rgbif
{

/** Name of the library with the general contract data types.  */
extern const std::string LIB_NAME_RGB_CONTRACT;

/** Name of the library with the unique-asset data types.  */
extern const std::string LIB_NAME_RGB21;

/**
 * The standard interfaces defined by this library.
 */
enum class IfaceStandard : uint8_t
{
  /** Fungible assets.  */
  RGB20,
  /** Unique (non-fungible) assets.  */
  RGB21,
  /** Collectible fungible assets.  */
  RGB25,
};

/**
 * Returns the canonical name of an interface standard, e.g. "RGB20".
 */
std::string IfaceStandardToString (IfaceStandard s);

/**
 * Parses an interface standard from its name.  Matching is
 * case-insensitive.  Returns false for unknown names.
 */
bool IfaceStandardFromString (const std::string& str, IfaceStandard& out);

std::ostream& operator<< (std::ostream& out, IfaceStandard s);

/**
 * A light wrapper class around the read-only registry of standard type
 * libraries and interfaces.  The underlying data is hard-coded in text
 * format, parsed once on first use and never modified afterwards.
 */
class TypeLib
{

private:

  class Data;

  /**
   * A reference to the singleton instance that actually holds all the
   * global state wrapped by this instance.
   */
  const Data* data;

  /**
   * The global singleton data instance or null when it is not yet
   * initialised.  This is never destructed.
   */
  static Data* instance;

public:

  /**
   * Constructs a fresh instance of the wrapper class, which will give
   * access to the underlying data.
   *
   * On the first call, this will also instantiate and set up the underlying
   * singleton instance with the real data.
   */
  TypeLib ();

  TypeLib (const TypeLib&) = delete;
  void operator= (const TypeLib&) = delete;

  /**
   * Exposes the actual protocol buffer.
   */
  const proto::TypeRegistry& operator* () const;

  /**
   * Exposes the actual protocol buffer's fields directly.
   */
  const proto::TypeRegistry* operator-> () const;

  /**
   * Returns the names of all libraries in the registry, sorted.
   */
  std::vector<std::string> LibraryNames () const;

  /**
   * Looks up a library by name, returning null if there is none.
   */
  const proto::LibraryData* LibraryOrNull (const std::string& name) const;

  /**
   * Looks up a library and asserts that it exists.
   */
  const proto::LibraryData& Library (const std::string& name) const;

  /**
   * Looks up a type by its fully-qualified name, e.g. "RGBContract.Amount".
   * Returns null if the name is malformed or there is no such type.
   */
  const proto::TypeData* TypeOrNull (const std::string& fullName) const;

  /**
   * Returns the definition of a standard interface or null if the registry
   * does not define it.
   */
  const proto::InterfaceData* InterfaceOrNull (IfaceStandard s) const;

  /**
   * Returns the definition of a standard interface and asserts that
   * it exists.
   */
  const proto::InterfaceData& Interface (IfaceStandard s) const;

  /**
   * Looks up a piece of state with the given name in an interface.
   * Base state as well as state of all optional features is considered.
   */
  const proto::StateData* StateOrNull (IfaceStandard s,
                                       const std::string& name) const;

};

} // namespace rgbif

#endif // PROTO_TYPELIB_HPP
