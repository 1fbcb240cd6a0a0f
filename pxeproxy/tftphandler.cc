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
#include <algorithm>
#include <sstream>

#include "logger.hh"
#include "misc.hh"
#include "pxeexception.hh"
#include "tftphandler.hh"

std::pair<MACAddress, int> parseTFTPPath(const string& path)
{
  vector<string> parts;
  stringtok(parts, path, "/");
  // stringtok eats empty fields, so "a//b" and "/a/b" have to be caught by counting slashes
  if (parts.size() != 2 || std::count(path.begin(), path.end(), '/') != 1 || path.front() == '/' || path.back() == '/') {
    throw TFTPNotFound("not found");
  }

  MACAddress mac;
  try {
    mac = MACAddress::parse(parts.at(0));
  }
  catch (const PXEProxyException&) {
    throw TFTPNotFound("not found");
  }

  const auto& code = parts.at(1);
  if (code.find_first_not_of("0123456789") != string::npos) {
    throw TFTPNotFound("not found");
  }
  try {
    return {mac, pxeproxy::checked_stoi<int>(code)};
  }
  catch (const std::out_of_range&) {
    throw TFTPNotFound("not found");
  }
}

TFTPImageDispatcher::TFTPImageDispatcher(std::shared_ptr<const ImageMap> images, std::shared_ptr<EventSink> events) :
  d_images(std::move(images)), d_events(std::move(events))
{
}

TFTPTransferSource TFTPImageDispatcher::open(const string& path, const ComboAddress& /* peer */) const
{
  int code = 0;
  try {
    code = parseTFTPPath(path).second;
  }
  catch (const TFTPNotFound&) {
    throw TFTPNotFound("unknown path \"" + path + "\"");
  }

  auto firmware = getFirmwareFromCode(code);
  if (!firmware) {
    throw UnknownFirmwareError("unknown firmware type " + std::to_string(code));
  }
  auto iter = d_images->find(*firmware);
  if (iter == d_images->end()) {
    throw UnknownFirmwareError("unknown firmware type " + std::to_string(code));
  }

  TFTPTransferSource ret;
  ret.stream = std::make_unique<std::istringstream>(iter->second);
  ret.size = iter->second.size();
  return ret;
}

void TFTPImageDispatcher::logTransfer(const ComboAddress& peer, const string& path, const std::optional<string>& error) const
{
  if (error) {
    g_log << Logger::Warning << "TFTP: send of \"" << path << "\" to " << peer << " failed: " << *error << endl;
    d_events->transferFailed(peer, path, *error);
    return;
  }

  MACAddress mac;
  try {
    mac = parseTFTPPath(path).first;
  }
  catch (const TFTPNotFound& e) {
    g_log << Logger::Warning << "TFTP: unable to extract MAC from request for \"" << path << "\" by " << peer << ": " << e.reason << endl;
    return;
  }
  g_log << Logger::Info << "TFTP: sent \"" << path << "\" to " << peer << endl;
  d_events->machineEvent(mac, MachineState::TFTP, "Sent iPXE to " + peer.toStringWithPort());
}
