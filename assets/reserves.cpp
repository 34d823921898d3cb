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

#include "reserves.hpp"

#include <glog/logging.h>

#include <limits>
#include <sstream>

namespace rgbif
{

/* ************************************************************************** */

bool
Outpoint::FromString (const std::string& str, Outpoint& out)
{
  const auto colon = str.find (':');
  if (colon == std::string::npos)
    {
      VLOG (1) << "Outpoint has no vout separator: " << str;
      return false;
    }

  Outpoint res;
  if (!res.txid.FromHex (str.substr (0, colon)))
    {
      VLOG (1) << "Invalid txid in outpoint: " << str;
      return false;
    }

  const std::string voutStr = str.substr (colon + 1);
  if (voutStr.empty () || voutStr.size () > 10)
    {
      VLOG (1) << "Invalid vout in outpoint: " << str;
      return false;
    }

  uint64_t vout = 0;
  for (const char c : voutStr)
    {
      if (c < '0' || c > '9')
        {
          VLOG (1) << "Invalid vout in outpoint: " << str;
          return false;
        }
      vout = 10 * vout + (c - '0');
    }
  if (vout > std::numeric_limits<uint32_t>::max ())
    {
      VLOG (1) << "Vout out of range in outpoint: " << str;
      return false;
    }
  res.vout = vout;

  out = res;
  return true;
}

std::string
Outpoint::ToString () const
{
  std::ostringstream out;
  out << txid.ToHex () << ':' << vout;
  return out.str ();
}

bool
operator== (const Outpoint& a, const Outpoint& b)
{
  return a.txid == b.txid && a.vout == b.vout;
}

bool
operator!= (const Outpoint& a, const Outpoint& b)
{
  return !(a == b);
}

bool
operator< (const Outpoint& a, const Outpoint& b)
{
  if (a.txid != b.txid)
    return a.txid < b.txid;
  return a.vout < b.vout;
}

std::ostream&
operator<< (std::ostream& out, const Outpoint& o)
{
  out << o.ToString ();
  return out;
}

void
StrictEncode (StrictWriter& out, const Outpoint& o)
{
  StrictEncode (out, o.txid);
  out.WriteU32 (o.vout);
}

bool
StrictDecode (StrictReader& in, Outpoint& o)
{
  return StrictDecode (in, o.txid) && in.ReadU32 (o.vout);
}

/* ************************************************************************** */

bool
operator== (const ProofOfReserves& a, const ProofOfReserves& b)
{
  return a.utxo == b.utxo && a.proof == b.proof;
}

bool
operator!= (const ProofOfReserves& a, const ProofOfReserves& b)
{
  return !(a == b);
}

bool
operator< (const ProofOfReserves& a, const ProofOfReserves& b)
{
  if (a.utxo != b.utxo)
    return a.utxo < b.utxo;
  return a.proof < b.proof;
}

std::ostream&
operator<< (std::ostream& out, const ProofOfReserves& p)
{
  out << p.utxo << " (" << p.proof.size () << " bytes proof)";
  return out;
}

void
StrictEncode (StrictWriter& out, const ProofOfReserves& p)
{
  StrictEncode (out, p.utxo);
  out.WriteConfined (p.proof, MAX_SMALL_BLOB);
}

bool
StrictDecode (StrictReader& in, ProofOfReserves& p)
{
  return StrictDecode (in, p.utxo)
            && in.ReadConfined (0, MAX_SMALL_BLOB, p.proof);
}

/* ************************************************************************** */

bool
operator== (const IssueMeta& a, const IssueMeta& b)
{
  return a.reserves == b.reserves;
}

bool
operator== (const BurnMeta& a, const BurnMeta& b)
{
  return a.burnProofs == b.burnProofs;
}

void
StrictEncode (StrictWriter& out, const IssueMeta& m)
{
  StrictEncodeSet (out, m.reserves, MAX_RESERVE_PROOFS);
}

bool
StrictDecode (StrictReader& in, IssueMeta& m)
{
  return StrictDecodeSet (in, MAX_RESERVE_PROOFS, m.reserves);
}

void
StrictEncode (StrictWriter& out, const BurnMeta& m)
{
  StrictEncodeSet (out, m.burnProofs, MAX_RESERVE_PROOFS);
}

bool
StrictDecode (StrictReader& in, BurnMeta& m)
{
  return StrictDecodeSet (in, MAX_RESERVE_PROOFS, m.burnProofs);
}

} // namespace rgbif
