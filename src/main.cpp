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

#include "proto/typelib.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <google/protobuf/stubs/common.h>
#include <google/protobuf/text_format.h>

#include <json/json.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace
{

DEFINE_string (lib, "",
               "if set, only the type library with this name is exported");
DEFINE_string (format, "json",
               "the output format, either 'json' or 'text' (protocol buffer"
               " text format)");
DEFINE_string (out, "",
               "file to write the output to (stdout if empty)");
DEFINE_bool (interfaces, false,
             "whether the standard interface definitions should be exported"
             " as well");

/**
 * Constructs the text-format output for the selected libraries.
 */
bool
ExportText (const rgbif::TypeLib& lib, const std::vector<std::string>& names,
            std::string& out)
{
  rgbif::proto::TypeRegistry pb;
  for (const auto& n : names)
    (*pb.mutable_libraries ())[n] = lib.Library (n);
  if (FLAGS_interfaces)
    *pb.mutable_interfaces () = lib->interfaces ();

  return google::protobuf::TextFormat::PrintToString (pb, &out);
}

/**
 * Runs the export for the parsed flags and returns the process exit code.
 */
int
Run ()
{
  const rgbif::TypeLib lib;

  std::vector<std::string> names;
  if (FLAGS_lib.empty ())
    names = lib.LibraryNames ();
  else if (lib.LibraryOrNull (FLAGS_lib) == nullptr)
    {
      std::cerr << "Error: unknown type library '" << FLAGS_lib << "'"
                << std::endl;
      return EXIT_FAILURE;
    }
  else
    names.push_back (FLAGS_lib);

  std::string output;
  if (FLAGS_format == "json")
    {
      const rgbif::StlJson converter(lib);
      Json::StreamWriterBuilder wbuilder;
      wbuilder["indentation"] = "  ";
      output = Json::writeString (wbuilder,
                                  converter.Export (names, FLAGS_interfaces));
      output += "\n";
    }
  else if (FLAGS_format == "text")
    {
      CHECK (ExportText (lib, names, output))
          << "Failed to print registry in text format";
    }
  else
    {
      std::cerr << "Error: unknown format '" << FLAGS_format << "'"
                << std::endl;
      return EXIT_FAILURE;
    }

  if (FLAGS_out.empty ())
    std::cout << output;
  else
    {
      std::ofstream file(FLAGS_out);
      file << output;
      file.close ();
      if (!file)
        {
          std::cerr << "Error: could not write to '" << FLAGS_out << "'"
                    << std::endl;
          return EXIT_FAILURE;
        }

      LOG (INFO)
          << "Exported " << names.size () << " type libraries to "
          << FLAGS_out;
    }

  return EXIT_SUCCESS;
}

} // anonymous namespace

int
main (int argc, char** argv)
{
  google::InitGoogleLogging (argv[0]);
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  gflags::SetUsageMessage ("Export the standard RGB type libraries");
  gflags::SetVersionString (RGBIF_VERSION);
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  const int rc = Run ();

  google::protobuf::ShutdownProtobufLibrary ();
  return rc;
}
