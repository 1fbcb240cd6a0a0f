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
#include <cstdint>
#include <system_error>
#include <thread>

#include "logger.hh"
#include "misc.hh"
#include "pxeexception.hh"
#include "threadname.hh"
#include "tftpserver.hh"

static uint16_t get16(const string& raw, size_t pos)
{
  return static_cast<uint16_t>((static_cast<uint8_t>(raw.at(pos)) << 8) | static_cast<uint8_t>(raw.at(pos + 1)));
}

static void append16(string& raw, uint16_t val)
{
  raw.push_back(static_cast<char>(val >> 8));
  raw.push_back(static_cast<char>(val & 0xff));
}

TFTPRequest parseTFTPRequest(const string& raw)
{
  if (raw.size() < 4) {
    throw TFTPProtocolError("request too short, " + std::to_string(raw.size()) + " bytes");
  }

  TFTPRequest ret;
  ret.opcode = get16(raw, 0);
  if (ret.opcode != TFTP_OPCODE_RRQ && ret.opcode != TFTP_OPCODE_WRQ) {
    throw TFTPProtocolError("unexpected opcode " + std::to_string(ret.opcode));
  }

  vector<string> fields;
  size_t pos = 2;
  while (pos < raw.size()) {
    auto end = raw.find('\0', pos);
    if (end == string::npos) {
      throw TFTPProtocolError("unterminated field in request");
    }
    fields.push_back(raw.substr(pos, end - pos));
    pos = end + 1;
  }

  if (fields.size() < 2) {
    throw TFTPProtocolError("request lacks a file name or a mode");
  }
  if (fields.at(0).empty()) {
    throw TFTPProtocolError("request has an empty file name");
  }
  if (fields.size() % 2 != 0) {
    throw TFTPProtocolError("option '" + fields.back() + "' has no value");
  }

  ret.filename = fields.at(0);
  ret.mode = toLower(fields.at(1));
  for (size_t idx = 2; idx < fields.size(); idx += 2) {
    ret.options.emplace(toLower(fields.at(idx)), fields.at(idx + 1));
  }
  return ret;
}

// std::nullopt means the client asked for something we can't use
static std::optional<uint16_t> getBlksize(const string& value)
{
  if (value.empty() || value.find_first_not_of("0123456789") != string::npos) {
    return std::nullopt;
  }
  auto digits = value.find_first_not_of('0');
  if (digits == string::npos) {
    return std::nullopt;
  }
  if (value.size() - digits > 5) {
    return TFTP_MAX_BLKSIZE;
  }
  auto requested = std::stoul(value.substr(digits));
  if (requested < TFTP_MIN_BLKSIZE) {
    return std::nullopt;
  }
  if (requested > TFTP_MAX_BLKSIZE) {
    return TFTP_MAX_BLKSIZE;
  }
  return static_cast<uint16_t>(requested);
}

TFTPNegotiation negotiateTFTPOptions(const TFTPRequest& request, size_t fileSize)
{
  TFTPNegotiation ret;

  auto iter = request.options.find("blksize");
  if (iter != request.options.end()) {
    auto blksize = getBlksize(iter->second);
    if (blksize) {
      ret.blksize = *blksize;
      ret.acknowledged["blksize"] = std::to_string(ret.blksize);
    }
  }

  if (request.options.count("tsize") != 0) {
    ret.acknowledged["tsize"] = std::to_string(fileSize);
  }
  return ret;
}

string makeTFTPData(uint16_t block, const string& data)
{
  string ret;
  ret.reserve(4 + data.size());
  append16(ret, TFTP_OPCODE_DATA);
  append16(ret, block);
  ret.append(data);
  return ret;
}

string makeTFTPAck(uint16_t block)
{
  string ret;
  append16(ret, TFTP_OPCODE_ACK);
  append16(ret, block);
  return ret;
}

string makeTFTPError(uint16_t code, const string& message)
{
  string ret;
  append16(ret, TFTP_OPCODE_ERROR);
  append16(ret, code);
  ret.append(message);
  ret.push_back('\0');
  return ret;
}

string makeTFTPOptionAck(const std::map<string, string>& options)
{
  string ret;
  append16(ret, TFTP_OPCODE_OACK);
  for (const auto& option : options) {
    ret.append(option.first);
    ret.push_back('\0');
    ret.append(option.second);
    ret.push_back('\0');
  }
  return ret;
}

// an error packet is a courtesy, failing to send one is not worth more than a log line
static void sendError(const Socket& sock, const ComboAddress& peer, uint16_t code, const string& message)
{
  try {
    sock.sendTo(makeTFTPError(code, message), peer);
  }
  catch (const NetworkError& e) {
    g_log << Logger::Warning << "TFTP: unable to send error to " << peer << ": " << e.what() << endl;
  }
}

// a zero SO_RCVTIMEO blocks forever, so never go below a microsecond
static struct timeval toTimeval(std::chrono::steady_clock::duration duration)
{
  auto usec = std::max<int64_t>(std::chrono::duration_cast<std::chrono::microseconds>(duration).count(), 1);
  struct timeval ret{};
  ret.tv_sec = static_cast<time_t>(usec / 1000000);
  ret.tv_usec = static_cast<suseconds_t>(usec % 1000000);
  return ret;
}

/* Waits for the ACK of 'block' from 'peer'. Packets from anyone else, and
   stale ACKs, are skipped but don't buy more time: TimeoutException comes
   when the retransmit timeout has passed since we started waiting. */
void TFTPServer::waitForAck(const Socket& sock, const ComboAddress& peer, uint16_t block) const
{
  const auto deadline = clock::now() + d_retransmitTimeout;
  string dgram;
  ComboAddress from;
  for (;;) {
    if (d_stopped) {
      throw TFTPProtocolError("transfer aborted, server is shutting down");
    }
    auto remaining = deadline - clock::now();
    if (remaining <= clock::duration::zero()) {
      throw TimeoutException("no ACK for block " + std::to_string(block));
    }
    sock.setReadTimeout(toTimeval(std::min(remaining, d_pollInterval)));
    try {
      sock.recvFrom(dgram, from);
    }
    catch (const TimeoutException&) {
      continue;
    }
    if (from != peer || dgram.size() < 4) {
      continue;
    }
    auto opcode = get16(dgram, 0);
    if (opcode == TFTP_OPCODE_ACK && get16(dgram, 2) == block) {
      return;
    }
    if (opcode == TFTP_OPCODE_ERROR) {
      throw TFTPProtocolError("client sent error " + std::to_string(get16(dgram, 2)) + ": " + string(dgram.c_str() + 4));
    }
  }
}

// sends 'packet' until 'block' is acknowledged, giving up after s_retries retransmissions
void TFTPServer::exchange(const Socket& sock, const ComboAddress& peer, const string& packet, uint16_t block) const
{
  for (int attempt = 0; attempt <= s_retries; attempt++) {
    sock.sendTo(packet, peer);
    try {
      waitForAck(sock, peer, block);
      return;
    }
    catch (const TimeoutException&) {
      DLOG(g_log << Logger::Debug << "TFTP: no ACK for block " << block << " from " << peer << ", attempt " << attempt << endl);
    }
  }
  throw TFTPProtocolError("timeout waiting for ACK of block " + std::to_string(block));
}

void TFTPServer::transfer(const TFTPRequest& request, const ComboAddress& peer) const
{
  try {
    Socket sock(AF_INET, SOCK_DGRAM, 0);
    ComboAddress ephemeral(d_local);
    ephemeral.setPort(0);
    sock.bind(ephemeral, false);

    if (request.mode != "octet") {
      sendError(sock, peer, TFTP_ERROR_UNDEFINED, "only octet mode is supported");
      d_transferLog(peer, request.filename, "unsupported transfer mode \"" + request.mode + "\"");
      return;
    }

    TFTPTransferSource source;
    try {
      source = d_handler(request.filename, peer);
    }
    catch (const PXEProxyException& e) {
      sendError(sock, peer, TFTP_ERROR_NOT_FOUND, e.reason);
      d_transferLog(peer, request.filename, e.reason);
      return;
    }

    auto negotiation = negotiateTFTPOptions(request, source.size);
    if (!negotiation.acknowledged.empty()) {
      exchange(sock, peer, makeTFTPOptionAck(negotiation.acknowledged), 0);
    }

    string buffer(negotiation.blksize, '\0');
    uint16_t block = 1;
    for (;;) {
      source.stream->read(&buffer.at(0), static_cast<std::streamsize>(buffer.size()));
      if (source.stream->bad()) {
        sendError(sock, peer, TFTP_ERROR_UNDEFINED, "read error");
        throw TFTPProtocolError("error reading \"" + request.filename + "\"");
      }
      auto got = static_cast<size_t>(source.stream->gcount());
      exchange(sock, peer, makeTFTPData(block, buffer.substr(0, got)), block);
      if (got < buffer.size()) {
        break;
      }
      // wraps around after 65535, which is what clients expect for large files
      block++;
    }
    d_transferLog(peer, request.filename, std::nullopt);
  }
  catch (const std::runtime_error& e) {
    d_transferLog(peer, request.filename, string(e.what()));
  }
  catch (const PXEProxyException& e) {
    d_transferLog(peer, request.filename, e.reason);
  }
}

TFTPServer::TFTPServer(const ComboAddress& local, TFTPHandler handler, TFTPTransferLog transferLog, const struct timeval& readTimeout, size_t maxTransfers, std::chrono::milliseconds retransmitTimeout) :
  d_socket(AF_INET, SOCK_DGRAM, 0), d_local(local), d_handler(std::move(handler)), d_transferLog(std::move(transferLog)), d_pollInterval(std::chrono::seconds(readTimeout.tv_sec) + std::chrono::microseconds(readTimeout.tv_usec)), d_retransmitTimeout(retransmitTimeout), d_maxTransfers(maxTransfers)
{
  if (!local.isIPv4()) {
    throw NetworkError("TFTP needs an IPv4 listen address, not " + local.toString());
  }
  if (d_maxTransfers == 0) {
    throw NetworkError("TFTP needs room for at least one transfer");
  }
  d_socket.bind(local, true);
  d_socket.setReadTimeout(readTimeout);
}

void TFTPServer::startTransfer(const TFTPRequest& request, const ComboAddress& peer)
{
  bool full = false;
  {
    std::lock_guard<std::mutex> lock(d_transfersLock);
    full = d_activeTransfers >= d_maxTransfers;
    if (!full) {
      d_activeTransfers++;
    }
  }
  if (full) {
    g_log << Logger::Warning << "TFTP: " << d_maxTransfers << " transfers running, refusing \"" << request.filename << "\" for " << peer << endl;
    sendError(d_socket, peer, TFTP_ERROR_UNDEFINED, "too many transfers, try again later");
    d_transferLog(peer, request.filename, string("too many concurrent transfers"));
    return;
  }

  try {
    std::thread worker([this, request, peer]() {
      setThreadName("pxe/tftp-xfer");
      transfer(request, peer);
      finishTransfer();
    });
    worker.detach();
  }
  catch (const std::system_error& e) {
    finishTransfer();
    g_log << Logger::Error << "TFTP: unable to start a transfer for " << peer << ": " << e.what() << endl;
    sendError(d_socket, peer, TFTP_ERROR_UNDEFINED, "unable to start transfer");
    d_transferLog(peer, request.filename, string("unable to start transfer: ") + e.what());
  }
}

void TFTPServer::finishTransfer()
{
  std::lock_guard<std::mutex> lock(d_transfersLock);
  d_activeTransfers--;
  d_transfersDone.notify_all();
}

void TFTPServer::waitForTransfers()
{
  std::unique_lock<std::mutex> lock(d_transfersLock);
  d_transfersDone.wait(lock, [this]() { return d_activeTransfers == 0; });
}

void TFTPServer::serve()
{
  string dgram;
  ComboAddress remote;
  try {
    while (!d_stopped) {
      try {
        d_socket.recvFrom(dgram, remote);
      }
      catch (const TimeoutException&) {
        continue;
      }

      TFTPRequest request;
      try {
        request = parseTFTPRequest(dgram);
      }
      catch (const TFTPProtocolError& e) {
        g_log << Logger::Debug << "TFTP: bad request from " << remote << ": " << e.what() << endl;
        sendError(d_socket, remote, TFTP_ERROR_ILLEGAL_OPERATION, e.what());
        continue;
      }

      if (request.opcode == TFTP_OPCODE_WRQ) {
        g_log << Logger::Debug << "TFTP: refusing write request for \"" << request.filename << "\" from " << remote << endl;
        sendError(d_socket, remote, TFTP_ERROR_ACCESS, "write requests are not supported");
        continue;
      }

      g_log << Logger::Debug << "TFTP: read request for \"" << request.filename << "\" from " << remote << endl;
      startTransfer(request, remote);
    }
  }
  catch (const NetworkError&) {
    // the workers use the handler and the log callback, which die with us
    d_stopped = true;
    waitForTransfers();
    throw;
  }
  waitForTransfers();
  d_socket.close();
}
