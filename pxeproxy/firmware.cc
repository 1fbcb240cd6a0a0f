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
#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "firmware.hh"

string toString(Architecture arch)
{
  switch (arch) {
  case Architecture::IA32:
    return "IA32";
  case Architecture::X64:
    return "X64";
  case Architecture::ARM64:
    return "ARM64";
  }
  return "unknown architecture " + std::to_string(static_cast<int>(arch));
}

string toString(Firmware firmware)
{
  switch (firmware) {
  case Firmware::X86PC:
    return "x86 BIOS";
  case Firmware::X86iPXE:
    return "x86 BIOS iPXE";
  case Firmware::PixiecoreiPXE:
    return "pxeproxy iPXE";
  case Firmware::EFI32:
    return "EFI32";
  case Firmware::EFI64:
    return "EFI64";
  case Firmware::EFIBC:
    return "EFI bytecode";
  case Firmware::EFIArm64:
    return "EFI ARM64";
  }
  return "unknown firmware " + std::to_string(getFirmwareCode(firmware));
}

std::optional<Firmware> getFirmwareFromCode(int code)
{
  switch (code) {
  case 0:
    return Firmware::X86PC;
  case 1:
    return Firmware::X86iPXE;
  case 2:
    return Firmware::PixiecoreiPXE;
  case 6:
    return Firmware::EFI32;
  case 7:
    return Firmware::EFI64;
  case 9:
    return Firmware::EFIBC;
  case 11:
    return Firmware::EFIArm64;
  default:
    return std::nullopt;
  }
}
