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

#include "bootpolicy.hh"
#include "pxeexception.hh"

StaticBootPolicy::StaticBootPolicy(BootSpec spec) :
  d_spec(std::move(spec))
{
  if (d_spec.kernel.empty()) {
    throw PXEProxyException("a static boot policy needs a kernel");
  }
}

std::optional<BootSpec> StaticBootPolicy::getBootSpec(const Machine& /* machine */)
{
  return d_spec;
}
