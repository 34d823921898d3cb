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

#include "stljson.hpp"

#include "jsonutils.hpp"

#include <glog/logging.h>

namespace rgbif
{

namespace
{

std::string
StateKindToString (const proto::StateKind k)
{
  switch (k)
    {
    case proto::GLOBAL:
      return "global";
    case proto::FUNGIBLE:
      return "fungible";
    case proto::STRUCTURED:
      return "structured";
    case proto::RIGHTS:
      return "rights";
    default:
      LOG (FATAL) << "Invalid state kind: " << static_cast<int> (k);
    }
}

std::string
OccurrencesToString (const proto::Occurrences o)
{
  switch (o)
    {
    case proto::ONCE:
      return "once";
    case proto::NONE_OR_ONCE:
      return "noneOrOnce";
    case proto::NONE_OR_MORE:
      return "noneOrMore";
    case proto::ONCE_OR_MORE:
      return "onceOrMore";
    default:
      LOG (FATAL) << "Invalid occurrences: " << static_cast<int> (o);
    }
}

/**
 * Converts a repeated string field to a JSON array.
 */
template <typename R>
  Json::Value
  StringsToJson (const R& strs)
{
  Json::Value res(Json::arrayValue);
  for (const auto& s : strs)
    res.append (s);
  return res;
}

/**
 * Converts the state and transitions of an interface or feature.  This
 * fills in the corresponding members of the given JSON object.
 */
template <typename P>
  void
  StateAndTransitions (const P& pb, Json::Value& res)
{
  Json::Value state(Json::arrayValue);
  for (const auto& s : pb.state ())
    state.append (StlJson::Convert (s));
  res["state"] = state;

  res["transitions"] = StringsToJson (pb.transitions ());
}

} // anonymous namespace

Json::Value
StlJson::Convert (const proto::StateData& state)
{
  Json::Value res(Json::objectValue);
  res["name"] = state.name ();
  res["kind"] = StateKindToString (state.kind ());
  if (state.has_type ())
    res["type"] = state.type ();
  res["occurrences"] = OccurrencesToString (state.occurrences ());

  return res;
}

Json::Value
StlJson::Library (const std::string& name) const
{
  const auto& pb = lib.Library (name);

  Json::Value res(Json::objectValue);
  res["id"] = pb.id ();
  res["version"] = pb.version ();
  res["dependencies"] = StringsToJson (pb.dependencies ());

  Json::Value types(Json::objectValue);
  for (const auto& entry : pb.types ())
    {
      Json::Value t(Json::objectValue);
      if (entry.second.has_fixed_size ())
        t["fixedSize"] = IntToJson (entry.second.fixed_size ());
      if (entry.second.has_description ())
        t["description"] = entry.second.description ();
      types[entry.first] = t;
    }
  res["types"] = types;

  return res;
}

Json::Value
StlJson::Interface (const IfaceStandard s) const
{
  const auto& pb = lib.Interface (s);

  Json::Value res(Json::objectValue);
  res["description"] = pb.description ();
  StateAndTransitions (pb, res);
  if (pb.has_default_transition ())
    res["defaultTransition"] = pb.default_transition ();

  Json::Value features(Json::objectValue);
  for (const auto& entry : pb.features ())
    {
      Json::Value f(Json::objectValue);
      f["description"] = entry.second.description ();
      StateAndTransitions (entry.second, f);
      features[entry.first] = f;
    }
  res["features"] = features;

  return res;
}

Json::Value
StlJson::Export (const std::vector<std::string>& libs,
                 const bool withInterfaces) const
{
  Json::Value res(Json::objectValue);

  Json::Value libraries(Json::objectValue);
  for (const auto& name : libs)
    libraries[name] = Library (name);
  res["libraries"] = libraries;

  if (withInterfaces)
    {
      Json::Value ifaces(Json::objectValue);
      for (const auto s : {IfaceStandard::RGB20, IfaceStandard::RGB21,
                           IfaceStandard::RGB25})
        ifaces[IfaceStandardToString (s)] = Interface (s);
      res["interfaces"] = ifaces;
    }

  return res;
}

} // namespace rgbif
