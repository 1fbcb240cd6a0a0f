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
#include <cerrno>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <netinet/in.h>

#include "iputils.hh"
#include "misc.hh"
#include "pxeexception.hh"
#include "namespaces.hh"

//! A datagram socket and the Berkeley functions we use on it
class Socket
{
public:
  Socket(const Socket&) = delete;
  Socket& operator=(const Socket&) = delete;

  //! Construct a socket of specified address family and socket type.
  Socket(int addressFamily, int socketType, int protocolType = 0) :
    d_socket(socket(addressFamily, socketType, protocolType))
  {
    if (d_socket < 0) {
      throw NetworkError(stringerror());
    }
    setCloseOnExec(d_socket);
  }

  Socket(Socket&& rhs) noexcept :
    d_socket(rhs.d_socket)
  {
    rhs.d_socket = -1;
  }

  Socket& operator=(Socket&& rhs) noexcept
  {
    if (d_socket != -1) {
      ::close(d_socket);
    }
    d_socket = rhs.d_socket;
    rhs.d_socket = -1;
    return *this;
  }

  ~Socket()
  {
    if (d_socket != -1) {
      ::close(d_socket);
    }
  }

  //! Bind the socket to a specified endpoint
  void bind(const ComboAddress& local, bool reuseaddr = true) const
  {
    int tmp = 1;
    if (reuseaddr && setsockopt(d_socket, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<char*>(&tmp), sizeof tmp) < 0) {
      throw NetworkError("Setsockopt failed: " + stringerror());
    }
    if (::bind(d_socket, reinterpret_cast<const struct sockaddr*>(&local), local.getSocklen()) < 0) {
      throw NetworkError("While binding to " + local.toStringWithPort() + ": " + stringerror());
    }
  }

  //! Ask the kernel to tell us which interface each datagram arrived on
  void enablePacketInfo() const
  {
    int one = 1;
    if (setsockopt(d_socket, IPPROTO_IP, IP_PKTINFO, &one, sizeof(one)) < 0) {
      throw NetworkError("Setting IP_PKTINFO: " + stringerror());
    }
  }

  void enableBroadcast() const
  {
    if (!setBroadcast(d_socket)) {
      throw NetworkError("Setting SO_BROADCAST: " + stringerror());
    }
  }

  //! Blocking receives give up after this long, zero means never
  void setReadTimeout(const struct timeval& timeout) const
  {
    if (!setReceiveTimeout(d_socket, timeout)) {
      throw NetworkError("Setting SO_RCVTIMEO: " + stringerror());
    }
  }

  /** For datagram sockets, receive a datagram and learn where it came from
      \param dgram Will be filled with the datagram
      \param remote Will be filled with the origin of the datagram
      Throws TimeoutException when the read timeout expires */
  void recvFrom(string& dgram, ComboAddress& remote) const
  {
    socklen_t remlen = sizeof(remote);
    dgram.resize(s_buflen);
    auto bytes = recvfrom(d_socket, &dgram.at(0), dgram.size(), 0, reinterpret_cast<sockaddr*>(&remote), &remlen);
    if (bytes < 0) {
      throwReceiveError("recvfrom");
    }
    dgram.resize(static_cast<size_t>(bytes));
  }

  /** Like recvFrom, but also returns the index of the interface the
      datagram arrived on, or 0 if the kernel did not say. Needs
      enablePacketInfo() */
  void recvFromWithInterface(string& dgram, ComboAddress& remote, unsigned int& itfIndex) const
  {
    struct msghdr msgh{};
    struct iovec iov{};
    cmsgbuf_aligned cbuf;
    dgram.resize(s_buflen);
    remote.sin4.sin_family = AF_INET;
    fillMSGHdr(&msgh, &iov, &cbuf, sizeof(cbuf), &dgram.at(0), dgram.size(), &remote);

    auto bytes = recvmsg(d_socket, &msgh, 0);
    if (bytes < 0) {
      throwReceiveError("recvmsg");
    }
    dgram.resize(static_cast<size_t>(bytes));
    itfIndex = 0;
    HarvestInterfaceIndex(&msgh, &itfIndex);
  }

  //! For datagram sockets, send a datagram to a destination
  void sendTo(const string& dgram, const ComboAddress& remote) const
  {
    if (sendto(d_socket, dgram.data(), dgram.size(), 0, reinterpret_cast<const sockaddr*>(&remote), remote.getSocklen()) < 0) {
      throw NetworkError("After sendto " + remote.toStringWithPort() + ": " + stringerror());
    }
  }

  //! Send a datagram to a destination, out of a specific interface
  void sendToVia(const string& dgram, const ComboAddress& remote, unsigned int itfIndex) const
  {
    struct msghdr msgh{};
    struct iovec iov{};
    cmsgbuf_aligned cbuf;
    ComboAddress dest(remote);
    ComboAddress source;
    string data(dgram);
    fillMSGHdr(&msgh, &iov, nullptr, 0, &data.at(0), data.size(), &dest);
    addCMsgSrcAddr(&msgh, &cbuf, &source, static_cast<int>(itfIndex));
    if (sendmsg(d_socket, &msgh, 0) < 0) {
      throw NetworkError("After sendmsg " + remote.toStringWithPort() + ": " + stringerror());
    }
  }

  //! Returns the address the socket is bound to
  [[nodiscard]] ComboAddress getLocal() const
  {
    ComboAddress local;
    socklen_t locallen = sizeof(local);
    if (getsockname(d_socket, reinterpret_cast<struct sockaddr*>(&local), &locallen) < 0) {
      throw NetworkError("getsockname: " + stringerror());
    }
    return local;
  }

  //! Returns the internal file descriptor of the socket
  [[nodiscard]] int getHandle() const
  {
    return d_socket;
  }

  void close()
  {
    if (d_socket != -1) {
      int fd = d_socket;
      d_socket = -1;
      if (::close(fd) < 0) {
        throw NetworkError("While closing socket: " + stringerror());
      }
    }
  }

private:
  [[noreturn]] static void throwReceiveError(const char* what)
  {
    int err = errno;
    if (err == EAGAIN || err == EWOULDBLOCK) {
      throw TimeoutException(string(what) + " timed out");
    }
    throw NetworkError(string("After ") + what + ": " + stringerror(err));
  }

  static constexpr size_t s_buflen{65536};
  int d_socket;
};
