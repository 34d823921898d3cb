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

/* Hard-coded text-format data of the standard type registry.  */

namespace rgbif
{

extern const char* const TYPELIB_PROTO_TEXT;

const char* const TYPELIB_PROTO_TEXT = R"(

libraries:
  {
    key: "RGBContract"
    value:
      {
        id: "stl:I4NuYOF!-OOlJuQ4-0$UOl8W-wEg5DOL-E8EP6!h-zfMxr2U#llama-flex-aztec"
        version: "0.12.0"
        dependencies: "Std"
        dependencies: "Bitcoin"

        types: { key: "Amount" value: { fixed_size: 8 description: "Asset quantity in minor units" } }
        types: { key: "Precision" value: { fixed_size: 1 description: "Number of decimal digits" } }
        types: { key: "Ticker" value: { description: "Asset ticker, 2 to 8 characters" } }
        types: { key: "AssetName" value: { description: "Asset name, 1 to 40 characters" } }
        types: { key: "Details" value: { description: "Free-form details, 1 to 255 characters" } }
        types: { key: "Article" value: { description: "Article of a contract, 1 to 32 characters" } }
        types: { key: "RicardianContract" value: { description: "Contract terms text" } }
        types: { key: "MediaRegName" value: { description: "MIME type component" } }
        types: { key: "MediaType" value: { description: "MIME media type" } }
        types: { key: "Attachment" value: { description: "Media type and digest of external data" } }
        types: { key: "AssetSpec" value: { description: "Specification of a fungible asset" } }
        types: { key: "ContractSpec" value: { description: "Specification of a collectible contract" } }
        types: { key: "ContractTerms" value: { description: "Terms of a contract" } }
        types: { key: "Outpoint" value: { fixed_size: 36 description: "Bitcoin transaction output" } }
        types: { key: "ProofOfReserves" value: { description: "Proof of reserves backing an asset" } }
        types: { key: "IssueMeta" value: { description: "Metadata of an issuance" } }
        types: { key: "BurnMeta" value: { description: "Metadata of a burn" } }
      }
  }

libraries:
  {
    key: "RGB21"
    value:
      {
        id: "stl:RGB21"
        version: "0.12.0"
        dependencies: "Std"
        dependencies: "RGBContract"

        types: { key: "TokenIndex" value: { fixed_size: 4 description: "Index of a token" } }
        types: { key: "OwnedFraction" value: { fixed_size: 8 description: "Owned part of a token" } }
        types: { key: "Nft" value: { fixed_size: 40 description: "Allocation of a token fraction" } }
        types: { key: "Fe256Align8" value: { fixed_size: 31 description: "Padding after an 8-bit field" } }
        types: { key: "Fe256Align16" value: { fixed_size: 30 description: "Padding after a 16-bit field" } }
        types: { key: "Fe256Align32" value: { fixed_size: 28 description: "Padding after a 32-bit field" } }
        types: { key: "Fe256Align64" value: { fixed_size: 24 description: "Padding after a 64-bit field" } }
        types: { key: "Fe256Align128" value: { fixed_size: 16 description: "Padding after a 128-bit field" } }
        types: { key: "AttachmentName" value: { description: "Name of an attachment type, 1 to 20 characters" } }
        types: { key: "AttachmentType" value: { description: "Identifier and name of an attachment type" } }
        types: { key: "EmbeddedMedia" value: { description: "Media data stored inline" } }
        types: { key: "NftEngraving" value: { description: "Engraving applied to a token" } }
        types: { key: "NftSpec" value: { description: "Full description of a token" } }
      }
  }

interfaces:
  {
    key: "RGB20"
    value:
      {
        description: "Fungible asset"
        state: { name: "spec" kind: GLOBAL type: "RGBContract.AssetSpec" occurrences: ONCE }
        state: { name: "terms" kind: GLOBAL type: "RGBContract.ContractTerms" occurrences: ONCE }
        state: { name: "issuedSupply" kind: GLOBAL type: "RGBContract.Amount" occurrences: ONCE_OR_MORE }
        state: { name: "maxSupply" kind: GLOBAL type: "RGBContract.Amount" occurrences: NONE_OR_ONCE }
        state: { name: "assetOwner" kind: FUNGIBLE occurrences: NONE_OR_MORE }
        transitions: "transfer"
        default_transition: "transfer"

        features:
          {
            key: "renameable"
            value:
              {
                description: "Spec can be updated by the holder of the update right"
                state: { name: "updateRight" kind: RIGHTS occurrences: ONCE }
                transitions: "rename"
              }
          }
        features:
          {
            key: "inflatable"
            value:
              {
                description: "Further supply can be issued"
                state: { name: "inflationAllowance" kind: FUNGIBLE occurrences: NONE_OR_MORE }
                transitions: "issue"
              }
          }
        features:
          {
            key: "burnable"
            value:
              {
                description: "Supply can be burned"
                state: { name: "burnedSupply" kind: GLOBAL type: "RGBContract.Amount" occurrences: NONE_OR_MORE }
                state: { name: "burnRight" kind: RIGHTS occurrences: ONCE_OR_MORE }
                transitions: "burn"
              }
          }
        features:
          {
            key: "replaceable"
            value:
              {
                description: "Burned supply can be replaced by new issuance"
                state: { name: "replacedSupply" kind: GLOBAL type: "RGBContract.Amount" occurrences: NONE_OR_MORE }
                state: { name: "burnEpoch" kind: RIGHTS occurrences: ONCE_OR_MORE }
                transitions: "openEpoch"
                transitions: "replace"
              }
          }
      }
  }

interfaces:
  {
    key: "RGB21"
    value:
      {
        description: "Unique digital asset"
        state: { name: "spec" kind: GLOBAL type: "RGBContract.AssetSpec" occurrences: ONCE }
        state: { name: "terms" kind: GLOBAL type: "RGBContract.ContractTerms" occurrences: ONCE }
        state: { name: "tokens" kind: GLOBAL type: "RGB21.NftSpec" occurrences: NONE_OR_MORE }
        state: { name: "attachmentTypes" kind: GLOBAL type: "RGB21.AttachmentType" occurrences: NONE_OR_MORE }
        state: { name: "assetOwner" kind: STRUCTURED type: "RGB21.Nft" occurrences: NONE_OR_MORE }
        transitions: "transfer"
        default_transition: "transfer"

        features:
          {
            key: "engravable"
            value:
              {
                description: "Owners can engrave media onto tokens"
                state: { name: "engravings" kind: GLOBAL type: "RGB21.NftEngraving" occurrences: NONE_OR_MORE }
                transitions: "engrave"
              }
          }
      }
  }

interfaces:
  {
    key: "RGB25"
    value:
      {
        description: "Collectible fungible asset"
        state: { name: "name" kind: GLOBAL type: "RGBContract.AssetName" occurrences: ONCE }
        state: { name: "details" kind: GLOBAL type: "RGBContract.Details" occurrences: NONE_OR_ONCE }
        state: { name: "precision" kind: GLOBAL type: "RGBContract.Precision" occurrences: ONCE }
        state: { name: "terms" kind: GLOBAL type: "RGBContract.ContractTerms" occurrences: ONCE }
        state: { name: "issuedSupply" kind: GLOBAL type: "RGBContract.Amount" occurrences: ONCE }
        state: { name: "assetOwner" kind: FUNGIBLE occurrences: NONE_OR_MORE }
        transitions: "transfer"
        default_transition: "transfer"

        features:
          {
            key: "burnable"
            value:
              {
                description: "Supply can be burned"
                state: { name: "burnedSupply" kind: GLOBAL type: "RGBContract.Amount" occurrences: NONE_OR_MORE }
                state: { name: "burnRight" kind: RIGHTS occurrences: ONCE_OR_MORE }
                transitions: "burn"
              }
          }
      }
  }

)";

} // namespace rgbif
