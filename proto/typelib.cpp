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

#include "typelib.hpp"

#include <google/protobuf/text_format.h>

#include <glog/logging.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>

namespace rgbif
{

extern const char* const TYPELIB_PROTO_TEXT;

const std::string LIB_NAME_RGB_CONTRACT = "RGBContract";
const std::string LIB_NAME_RGB21 = "RGB21";

/* ************************************************************************** */

std::string
IfaceStandardToString (const IfaceStandard s)
{
  switch (s)
    {
    case IfaceStandard::RGB20:
      return "RGB20";
    case IfaceStandard::RGB21:
      return "RGB21";
    case IfaceStandard::RGB25:
      return "RGB25";
    default:
      LOG (FATAL) << "Invalid IfaceStandard: " << static_cast<int> (s);
    }
}

bool
IfaceStandardFromString (const std::string& str, IfaceStandard& out)
{
  std::string upper = str;
  std::transform (upper.begin (), upper.end (), upper.begin (),
                  [] (const unsigned char c)
                    {
                      return static_cast<char> (std::toupper (c));
                    });

  for (const auto s : {IfaceStandard::RGB20, IfaceStandard::RGB21,
                       IfaceStandard::RGB25})
    if (IfaceStandardToString (s) == upper)
      {
        out = s;
        return true;
      }

  VLOG (1) << "Unknown interface standard: " << str;
  return false;
}

std::ostream&
operator<< (std::ostream& out, const IfaceStandard s)
{
  out << IfaceStandardToString (s);
  return out;
}

/* ************************************************************************** */

namespace
{

/** Lock for constructing the global singleton.  */
std::mutex mutInstance;

/**
 * Splits a fully-qualified type name into library and type.  Returns false
 * if the name has not exactly one dot or an empty part.
 */
bool
SplitTypeName (const std::string& fullName, std::string& lib,
               std::string& type)
{
  const auto dot = fullName.find ('.');
  if (dot == std::string::npos || fullName.find ('.', dot + 1)
                                      != std::string::npos)
    return false;

  lib = fullName.substr (0, dot);
  type = fullName.substr (dot + 1);
  return !lib.empty () && !type.empty ();
}

} // anonymous namespace

/**
 * Data for the singleton instance of the registry.
 */
class TypeLib::Data
{

public:

  /** The protocol buffer instance itself.  */
  proto::TypeRegistry proto;

};

TypeLib::Data* TypeLib::instance = nullptr;

TypeLib::TypeLib ()
{
  std::lock_guard<std::mutex> lock(mutInstance);

  if (instance == nullptr)
    {
      LOG (INFO) << "Initialising hard-coded TypeRegistry proto instance...";

      auto newData = std::make_unique<Data> ();
      auto& pb = newData->proto;
      CHECK (google::protobuf::TextFormat::ParseFromString (TYPELIB_PROTO_TEXT,
                                                            &pb));

      for (const auto& lib : pb.libraries ())
        CHECK (!lib.second.id ().empty ())
            << "Library " << lib.first << " has no id";

      instance = newData.release ();
      data = instance;

      /* Every typed piece of interface state must refer to a known type.  */
      for (const auto& iface : pb.interfaces ())
        {
          IfaceStandard s;
          CHECK (IfaceStandardFromString (iface.first, s))
              << "Unknown interface in registry: " << iface.first;

          std::vector<const proto::StateData*> allState;
          for (const auto& st : iface.second.state ())
            allState.push_back (&st);
          for (const auto& f : iface.second.features ())
            for (const auto& st : f.second.state ())
              allState.push_back (&st);

          for (const auto* st : allState)
            {
              CHECK (st->kind () != proto::STATE_INVALID)
                  << "State " << st->name () << " has no kind";
              if (st->has_type ())
                CHECK (TypeOrNull (st->type ()) != nullptr)
                    << "Unknown type " << st->type ()
                    << " for state " << st->name ();
            }
        }

      LOG (INFO)
          << "Type registry has " << pb.libraries_size () << " libraries and "
          << pb.interfaces_size () << " interfaces";
    }

  data = instance;
  CHECK (data != nullptr);
}

const proto::TypeRegistry&
TypeLib::operator* () const
{
  return data->proto;
}

const proto::TypeRegistry*
TypeLib::operator-> () const
{
  return &(operator* ());
}

std::vector<std::string>
TypeLib::LibraryNames () const
{
  std::vector<std::string> res;
  for (const auto& lib : data->proto.libraries ())
    res.push_back (lib.first);

  std::sort (res.begin (), res.end ());
  return res;
}

const proto::LibraryData*
TypeLib::LibraryOrNull (const std::string& name) const
{
  const auto& libs = data->proto.libraries ();
  const auto mit = libs.find (name);
  if (mit == libs.end ())
    return nullptr;

  return &mit->second;
}

const proto::LibraryData&
TypeLib::Library (const std::string& name) const
{
  const auto* ptr = LibraryOrNull (name);
  CHECK (ptr != nullptr) << "Unknown type library: " << name;
  return *ptr;
}

const proto::TypeData*
TypeLib::TypeOrNull (const std::string& fullName) const
{
  std::string libName, typeName;
  if (!SplitTypeName (fullName, libName, typeName))
    return nullptr;

  const auto* lib = LibraryOrNull (libName);
  if (lib == nullptr)
    return nullptr;

  const auto mit = lib->types ().find (typeName);
  if (mit == lib->types ().end ())
    return nullptr;

  return &mit->second;
}

const proto::InterfaceData*
TypeLib::InterfaceOrNull (const IfaceStandard s) const
{
  const auto& ifaces = data->proto.interfaces ();
  const auto mit = ifaces.find (IfaceStandardToString (s));
  if (mit == ifaces.end ())
    return nullptr;

  return &mit->second;
}

const proto::InterfaceData&
TypeLib::Interface (const IfaceStandard s) const
{
  const auto* ptr = InterfaceOrNull (s);
  CHECK (ptr != nullptr) << "Unknown interface: " << s;
  return *ptr;
}

const proto::StateData*
TypeLib::StateOrNull (const IfaceStandard s, const std::string& name) const
{
  const auto* iface = InterfaceOrNull (s);
  if (iface == nullptr)
    return nullptr;

  for (const auto& st : iface->state ())
    if (st.name () == name)
      return &st;

  for (const auto& f : iface->features ())
    for (const auto& st : f.second.state ())
      if (st.name () == name)
        return &st;

  return nullptr;
}

} // namespace rgbif
