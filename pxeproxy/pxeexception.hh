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

#include <string>
#include <utility>

#include "namespaces.hh"

//! Generic Exception thrown
class PXEProxyException
{
public:
  PXEProxyException() :
    reason("Unspecified") {}
  PXEProxyException(string r) :
    reason(std::move(r)) {}

  string reason; //! Print this to tell the user what went wrong
};

class TimeoutException : public PXEProxyException
{
public:
  TimeoutException() :
    PXEProxyException() {}
  TimeoutException(string r) :
    PXEProxyException(std::move(r)) {}
};

//! No usable address on the interface a request arrived on
class NoAddressError : public PXEProxyException
{
public:
  NoAddressError(string r) :
    PXEProxyException(std::move(r)) {}
};

//! The packet is not something we should answer, not an error as such
class NotApplicable : public PXEProxyException
{
public:
  NotApplicable(string r) :
    PXEProxyException(std::move(r)) {}
};

//! The packet is a boot request, but one we can't use
class ValidationError : public PXEProxyException
{
public:
  ValidationError(string r) :
    PXEProxyException(std::move(r)) {}
};

class UnknownFirmwareError : public PXEProxyException
{
public:
  UnknownFirmwareError(string r) :
    PXEProxyException(std::move(r)) {}
};

class TFTPNotFound : public PXEProxyException
{
public:
  TFTPNotFound(string r) :
    PXEProxyException(std::move(r)) {}
};
