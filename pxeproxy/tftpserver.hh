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
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/time.h>
#include <boost/noncopyable.hpp>

#include "iputils.hh"
#include "sstuff.hh"
#include "tftphandler.hh"

static const uint16_t TFTP_PORT = 69;

// RFC 1350, RFC 2347
enum TFTPOpcode : uint16_t
{
  TFTP_OPCODE_RRQ = 1,
  TFTP_OPCODE_WRQ = 2,
  TFTP_OPCODE_DATA = 3,
  TFTP_OPCODE_ACK = 4,
  TFTP_OPCODE_ERROR = 5,
  TFTP_OPCODE_OACK = 6
};

enum TFTPErrorCode : uint16_t
{
  TFTP_ERROR_UNDEFINED = 0,
  TFTP_ERROR_NOT_FOUND = 1,
  TFTP_ERROR_ACCESS = 2,
  TFTP_ERROR_ILLEGAL_OPERATION = 4,
  TFTP_ERROR_OPTION = 8
};

// RFC 2348
static const uint16_t TFTP_DEFAULT_BLKSIZE = 512;
static const uint16_t TFTP_MIN_BLKSIZE = 8;
static const uint16_t TFTP_MAX_BLKSIZE = 65464;

class TFTPProtocolError : public runtime_error
{
public:
  TFTPProtocolError(const string& str) :
    runtime_error(str)
  {}
};

//! A read or write request. Mode and option names are lower cased
struct TFTPRequest
{
  uint16_t opcode{TFTP_OPCODE_RRQ};
  string filename;
  string mode;
  std::map<string, string> options;
};

//! Throws TFTPProtocolError when 'raw' is not a well formed RRQ or WRQ
TFTPRequest parseTFTPRequest(const string& raw);

//! The transfer parameters we agree to, and the options that go into the OACK
struct TFTPNegotiation
{
  uint16_t blksize{TFTP_DEFAULT_BLKSIZE};
  std::map<string, string> acknowledged;
};

/** Looks at blksize and tsize, everything else is ignored as RFC 2347
    allows. A blksize below the minimum is not acknowledged, one above the
    maximum is lowered to it. */
TFTPNegotiation negotiateTFTPOptions(const TFTPRequest& request, size_t fileSize);

string makeTFTPData(uint16_t block, const string& data);
string makeTFTPAck(uint16_t block);
string makeTFTPError(uint16_t code, const string& message);
string makeTFTPOptionAck(const std::map<string, string>& options);

using TFTPHandler = std::function<TFTPTransferSource(const string& path, const ComboAddress& peer)>;
using TFTPTransferLog = std::function<void(const ComboAddress& peer, const string& path, const std::optional<string>& error)>;

/** Read-only TFTP server. Every read request is served from its own
    socket by its own thread, so transfers don't hold up each other or the
    listener. At most 'maxTransfers' run at the same time, requests beyond
    that get an ERROR. */
class TFTPServer : public boost::noncopyable
{
public:
  TFTPServer(const ComboAddress& local, TFTPHandler handler, TFTPTransferLog transferLog, const struct timeval& readTimeout = {1, 0}, size_t maxTransfers = s_defaultMaxTransfers, std::chrono::milliseconds retransmitTimeout = std::chrono::seconds(1));

  /** Runs until stop(), throws NetworkError if the listening socket fails.
      Does not return before every transfer it started has ended. */
  void serve();
  //! Running transfers give up at their next wait for an ACK
  void stop()
  {
    d_stopped = true;
  }
  //! Where we ended up listening, useful when bound to port 0
  [[nodiscard]] ComboAddress getLocal() const
  {
    return d_socket.getLocal();
  }

  static constexpr int s_retries{5};
  static constexpr size_t s_defaultMaxTransfers{64};

private:
  using clock = std::chrono::steady_clock;

  void startTransfer(const TFTPRequest& request, const ComboAddress& peer);
  void transfer(const TFTPRequest& request, const ComboAddress& peer) const;
  void exchange(const Socket& sock, const ComboAddress& peer, const string& packet, uint16_t block) const;
  void waitForAck(const Socket& sock, const ComboAddress& peer, uint16_t block) const;
  void finishTransfer();
  void waitForTransfers();

  Socket d_socket;
  ComboAddress d_local;
  TFTPHandler d_handler;
  TFTPTransferLog d_transferLog;
  clock::duration d_pollInterval;
  clock::duration d_retransmitTimeout;
  size_t d_maxTransfers;

  std::mutex d_transfersLock;
  std::condition_variable d_transfersDone;
  size_t d_activeTransfers{0};

  std::atomic<bool> d_stopped{false};
};
