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
#include <optional>
#include <string>
#include <vector>

#include "firmware.hh"
#include "namespaces.hh"

//! What to boot. The negotiation does not look inside, it only cares whether there is one
struct BootSpec
{
  string kernel;
  vector<string> initrds;
  string cmdline;
  string message;
};

//! Decides per machine what it boots. Implementations may be called from several threads
class BootPolicy
{
public:
  virtual ~BootPolicy() = default;
  //! std::nullopt means this machine should not netboot, throws PXEProxyException on failure
  virtual std::optional<BootSpec> getBootSpec(const Machine& machine) = 0;
};

//! Every machine boots the same thing
class StaticBootPolicy : public BootPolicy
{
public:
  //! Throws PXEProxyException when there is no kernel to boot
  explicit StaticBootPolicy(BootSpec spec);
  std::optional<BootSpec> getBootSpec(const Machine& machine) override;

private:
  const BootSpec d_spec;
};
