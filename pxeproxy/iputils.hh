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
#include <array>
#include <arpa/inet.h>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <tuple>
#include <vector>

#include "misc.hh"
#include "pxeexception.hh"

#include "namespaces.hh"

int makeIPv4sockaddr(const std::string& str, struct sockaddr_in* ret);
//! Plain IPv6 addresses only, no brackets and no port
int makeIPv6sockaddr(const std::string& addr, struct sockaddr_in6* ret);

union ComboAddress
{
  sockaddr_in sin4{};
  sockaddr_in6 sin6;

  bool operator==(const ComboAddress& rhs) const
  {
    if (std::tie(sin4.sin_family, sin4.sin_port) != std::tie(rhs.sin4.sin_family, rhs.sin4.sin_port)) {
      return false;
    }
    if (sin4.sin_family == AF_INET) {
      return sin4.sin_addr.s_addr == rhs.sin4.sin_addr.s_addr;
    }
    return memcmp(&sin6.sin6_addr.s6_addr, &rhs.sin6.sin6_addr.s6_addr, sizeof(sin6.sin6_addr.s6_addr)) == 0;
  }

  bool operator!=(const ComboAddress& rhs) const
  {
    return (!operator==(rhs));
  }

  bool operator<(const ComboAddress& rhs) const
  {
    if (sin4.sin_family == 0) {
      return false;
    }
    if (std::tie(sin4.sin_family, sin4.sin_port) < std::tie(rhs.sin4.sin_family, rhs.sin4.sin_port)) {
      return true;
    }
    if (std::tie(sin4.sin_family, sin4.sin_port) > std::tie(rhs.sin4.sin_family, rhs.sin4.sin_port)) {
      return false;
    }
    if (sin4.sin_family == AF_INET) {
      return sin4.sin_addr.s_addr < rhs.sin4.sin_addr.s_addr;
    }
    return memcmp(&sin6.sin6_addr.s6_addr, &rhs.sin6.sin6_addr.s6_addr, sizeof(sin6.sin6_addr.s6_addr)) < 0;
  }

  [[nodiscard]] socklen_t getSocklen() const
  {
    if (sin4.sin_family == AF_INET) {
      return sizeof(sin4);
    }
    return sizeof(sin6);
  }

  ComboAddress()
  {
    sin4.sin_family = AF_INET;
    sin4.sin_addr.s_addr = 0;
    sin4.sin_port = 0;
    sin6.sin6_scope_id = 0;
    sin6.sin6_flowinfo = 0;
  }

  ComboAddress(const struct sockaddr* socketAddress, socklen_t salen)
  {
    setSockaddr(socketAddress, salen);
  };

  ComboAddress(const struct sockaddr_in* socketAddress)
  {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    setSockaddr(reinterpret_cast<const struct sockaddr*>(socketAddress), sizeof(struct sockaddr_in));
  };

  void setSockaddr(const struct sockaddr* socketAddress, socklen_t salen)
  {
    if (salen > sizeof(struct sockaddr_in6)) {
      throw PXEProxyException("ComboAddress can't handle other than sockaddr_in or sockaddr_in6");
    }
    memcpy(this, socketAddress, salen);
  }

  // 'port' sets a default value in case 'str' does not set a port
  explicit ComboAddress(const string& str, uint16_t port = 0)
  {
    memset(&sin6, 0, sizeof(sin6));
    sin4.sin_family = AF_INET;
    sin4.sin_port = 0;
    if (makeIPv4sockaddr(str, &sin4) != 0) {
      sin6.sin6_family = AF_INET6;
      if (makeIPv6sockaddr(str, &sin6) < 0) {
        throw PXEProxyException("Unable to convert presentation address '" + str + "'");
      }
    }
    if (sin4.sin_port == 0) { // 'str' overrides port!
      sin4.sin_port = htons(port);
    }
  }

  //! Build an IPv4 address from the 4 network order bytes found in a packet
  static ComboAddress fromIPv4Bytes(const uint8_t* raw, uint16_t port = 0)
  {
    ComboAddress ret;
    memcpy(&ret.sin4.sin_addr.s_addr, raw, sizeof(ret.sin4.sin_addr.s_addr));
    ret.sin4.sin_port = htons(port);
    return ret;
  }

  [[nodiscard]] bool isIPv6() const
  {
    return sin4.sin_family == AF_INET6;
  }
  [[nodiscard]] bool isIPv4() const
  {
    return sin4.sin_family == AF_INET;
  }

  //! 0.0.0.0 or ::
  [[nodiscard]] bool isUnspecified() const
  {
    if (isIPv4()) {
      return sin4.sin_addr.s_addr == 0;
    }
    if (isIPv6()) {
      return memcmp(&sin6.sin6_addr, &in6addr_any, sizeof(sin6.sin6_addr)) == 0;
    }
    return false;
  }

  [[nodiscard]] bool isLoopback() const
  {
    if (isIPv4()) {
      return (ntohl(sin4.sin_addr.s_addr) & 0xff000000) == 0x7f000000;
    }
    if (isIPv6()) {
      return memcmp(&sin6.sin6_addr, &in6addr_loopback, sizeof(sin6.sin6_addr)) == 0;
    }
    return false;
  }

  //! 169.254.0.0/16 or fe80::/10
  [[nodiscard]] bool isLinkLocal() const
  {
    if (isIPv4()) {
      return (ntohl(sin4.sin_addr.s_addr) & 0xffff0000) == 0xa9fe0000;
    }
    if (isIPv6()) {
      return sin6.sin6_addr.s6_addr[0] == 0xfe && (sin6.sin6_addr.s6_addr[1] & 0xc0) == 0x80;
    }
    return false;
  }

  [[nodiscard]] bool isMulticast() const
  {
    if (isIPv4()) {
      return (ntohl(sin4.sin_addr.s_addr) & 0xf0000000) == 0xe0000000;
    }
    if (isIPv6()) {
      return sin6.sin6_addr.s6_addr[0] == 0xff;
    }
    return false;
  }

  [[nodiscard]] bool isLimitedBroadcast() const
  {
    return isIPv4() && sin4.sin_addr.s_addr == INADDR_BROADCAST;
  }

  /** A unicast address with more than link scope. This includes the
      RFC 1918 ranges, which are "global" for our purposes. */
  [[nodiscard]] bool isGlobalUnicast() const
  {
    return (isIPv4() || isIPv6()) && !isUnspecified() && !isLimitedBroadcast() && !isLoopback() && !isMulticast() && !isLinkLocal();
  }

  [[nodiscard]] string toString() const
  {
    std::array<char, 1024> host{};
    if (sin4.sin_family != 0) {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      int retval = getnameinfo(reinterpret_cast<const struct sockaddr*>(this), getSocklen(), host.data(), host.size(), nullptr, 0, NI_NUMERICHOST);
      if (retval == 0) {
        return host.data();
      }
      return "invalid " + string(gai_strerror(retval));
    }
    return "invalid";
  }

  [[nodiscard]] string toStringWithPort() const
  {
    if (sin4.sin_family == AF_INET) {
      return toString() + ":" + std::to_string(ntohs(sin4.sin_port));
    }
    return "[" + toString() + "]:" + std::to_string(ntohs(sin4.sin_port));
  }

  [[nodiscard]] string toLogString() const
  {
    return toStringWithPort();
  }

  //! The 4 bytes of an IPv4 address, in network order, as they go on the wire
  [[nodiscard]] string toByteString() const
  {
    // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
    if (isIPv4()) {
      return {reinterpret_cast<const char*>(&sin4.sin_addr.s_addr), sizeof(sin4.sin_addr.s_addr)};
    }
    return {reinterpret_cast<const char*>(&sin6.sin6_addr.s6_addr), sizeof(sin6.sin6_addr.s6_addr)};
    // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)
  }

  [[nodiscard]] uint16_t getPort() const noexcept
  {
    return ntohs(sin4.sin_port);
  }
  void setPort(uint16_t port)
  {
    sin4.sin_port = htons(port);
  }
};

inline std::ostream& operator<<(std::ostream& ostr, const ComboAddress& address)
{
  ostr << address.toStringWithPort();
  return ostr;
}

class NetworkError : public runtime_error
{
public:
  NetworkError(const string& why = "Network Error") :
    runtime_error(why.c_str())
  {}
  NetworkError(const char* why = "Network Error") :
    runtime_error(why)
  {}
};

//! A network interface as the kernel knows it
struct NetworkInterface
{
  unsigned int index{0};
  string name;
};

// An aligned type to hold cmsgbufs. See https://man.openbsd.org/CMSG_DATA
typedef union { struct cmsghdr hdr; char buf[256]; } cmsgbuf_aligned;

//! Extracts the index of the interface a datagram arrived on from IP_PKTINFO
bool HarvestInterfaceIndex(const struct msghdr* msgh, unsigned int* itfIndex);
void fillMSGHdr(struct msghdr* msgh, struct iovec* iov, cmsgbuf_aligned* cbuf, size_t cbufsize, char* data, size_t datalen, ComboAddress* addr);
//! Sets the IPv4 source address and outgoing interface of a sendmsg() through IP_PKTINFO
void addCMsgSrcAddr(struct msghdr* msgh, cmsgbuf_aligned* cmsgbuf, const ComboAddress* source, int itfIndex);

//! Throws NetworkError if the kernel does not know this index
NetworkInterface getNetworkInterfaceByIndex(unsigned int index);
std::vector<ComboAddress> getListOfAddressesOfNetworkInterface(const std::string& itf);
