/*
 * This file is part of pxeproxy.
 * Copyright -- pxeproxy contributors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of version 2 of the GNU General Public License as
 * published by the Free Software Foundation.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */
#pragma once
#include <map>
#include <optional>
#include <string>

#include "macaddress.hh"
#include "namespaces.hh"

//! CPU architecture of a client, the value is what the iPXE handoff URL carries
enum class Architecture : int
{
  IA32 = 0,
  X64 = 1,
  ARM64 = 2
};

/** What a client boots with. The value is the firmware type code that
    shows up in boot file names and TFTP paths, <mac>/<code> */
enum class Firmware : int
{
  X86PC = 0, // classic BIOS PXE ROM
  X86iPXE = 1, // BIOS running iPXE
  PixiecoreiPXE = 2, // our own iPXE, after one round of chainloading
  EFI32 = 6,
  EFI64 = 7,
  EFIBC = 9,
  EFIArm64 = 11
};

string toString(Architecture arch);
string toString(Firmware firmware);

inline int getFirmwareCode(Firmware firmware)
{
  return static_cast<int>(firmware);
}

//! std::nullopt if 'code' is not one of ours
std::optional<Firmware> getFirmwareFromCode(int code);

//! A client, as far as boot decisions are concerned
struct Machine
{
  MACAddress mac;
  Architecture arch{Architecture::IA32};
};

//! Second stage loader per firmware type, filled at startup and never changed afterwards
using ImageMap = std::map<Firmware, string>;
