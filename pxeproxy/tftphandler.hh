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
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "firmware.hh"
#include "iputils.hh"
#include "macaddress.hh"
#include "machineevent.hh"

//! What a TFTP read request gets to read, and how much of it there is
struct TFTPTransferSource
{
  std::unique_ptr<std::istream> stream;
  size_t size{0};
};

/** Splits a TFTP path of the form <mac>/<firmware code>. Throws
    TFTPNotFound for anything else. */
std::pair<MACAddress, int> parseTFTPPath(const string& path);

/** Serves the second stage loaders. The path a client asks for is the
    boot file name we gave it in the offer, so it tells us who is asking
    and with which firmware. */
class TFTPImageDispatcher
{
public:
  TFTPImageDispatcher(std::shared_ptr<const ImageMap> images, std::shared_ptr<EventSink> events);

  /** Throws TFTPNotFound when the path does not parse, and
      UnknownFirmwareError when there is no image for the firmware */
  TFTPTransferSource open(const string& path, const ComboAddress& peer) const;
  /** Called once per finished transfer, 'error' is empty on success. A
      success becomes a machine event, a failure a transferFailed event */
  void logTransfer(const ComboAddress& peer, const string& path, const std::optional<string>& error) const;

private:
  std::shared_ptr<const ImageMap> d_images;
  std::shared_ptr<EventSink> d_events;
};
