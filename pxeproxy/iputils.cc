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

#include <net/if.h>
#include <sys/socket.h>

#ifdef HAVE_GETIFADDRS
#include <ifaddrs.h>
#endif

#include "iputils.hh"

int makeIPv6sockaddr(const std::string& addr, struct sockaddr_in6* ret)
{
  if (addr.empty()) {
    return -1;
  }
  ret->sin6_scope_id = 0;
  ret->sin6_family = AF_INET6;
  if (inet_pton(AF_INET6, addr.c_str(), &ret->sin6_addr) != 1) {
    return -1;
  }
  return 0;
}

int makeIPv4sockaddr(const std::string& str, struct sockaddr_in* ret)
{
  if (str.empty()) {
    return -1;
  }
  struct in_addr inp;

  string::size_type pos = str.find(':');
  if (pos == string::npos) { // no port specified, not touching the port
    if (inet_aton(str.c_str(), &inp)) {
      ret->sin_addr.s_addr = inp.s_addr;
      return 0;
    }
    return -1;
  }
  if (!*(str.c_str() + pos + 1)) // trailing :
    return -1;

  char* eptr = const_cast<char*>(str.c_str()) + str.size();
  int port = strtol(str.c_str() + pos + 1, &eptr, 10);
  if (port < 0 || port > 65535)
    return -1;

  if (*eptr)
    return -1;

  ret->sin_port = htons(port);
  if (inet_aton(str.substr(0, pos).c_str(), &inp)) {
    ret->sin_addr.s_addr = inp.s_addr;
    return 0;
  }
  return -1;
}

bool HarvestInterfaceIndex(const struct msghdr* msgh, unsigned int* itfIndex)
{
  const struct cmsghdr* cmsg{};
  for (cmsg = CMSG_FIRSTHDR(msgh); cmsg != nullptr; cmsg = CMSG_NXTHDR(const_cast<struct msghdr*>(msgh), const_cast<struct cmsghdr*>(cmsg))) {
#if defined(IP_PKTINFO)
    if ((cmsg->cmsg_level == IPPROTO_IP) && (cmsg->cmsg_type == IP_PKTINFO)) {
      const auto* ptr = reinterpret_cast<const struct in_pktinfo*>(CMSG_DATA(cmsg));
      *itfIndex = static_cast<unsigned int>(ptr->ipi_ifindex);
      return true;
    }
#endif
  }
  return false;
}

// be careful: when using this for receive purposes, make sure addr->sin4.sin_family is set appropriately so getSocklen works!
// be careful: when using this function for *send* purposes, be sure to set cbufsize to 0!
// be careful: if you don't call addCMsgSrcAddr after fillMSGHdr, make sure to set msg_control to NULL
void fillMSGHdr(struct msghdr* msgh, struct iovec* iov, cmsgbuf_aligned* cbuf, size_t cbufsize, char* data, size_t datalen, ComboAddress* addr)
{
  iov->iov_base = data;
  iov->iov_len = datalen;

  memset(msgh, 0, sizeof(struct msghdr));

  msgh->msg_control = cbuf;
  msgh->msg_controllen = cbufsize;
  msgh->msg_name = addr;
  msgh->msg_namelen = addr->getSocklen();
  msgh->msg_iov = iov;
  msgh->msg_iovlen = 1;
  msgh->msg_flags = 0;
}

// Note that cmsgbuf should be aligned the same as a struct cmsghdr
void addCMsgSrcAddr(struct msghdr* msgh, cmsgbuf_aligned* cmsgbuf, const ComboAddress* source, int itfIndex)
{
  if (source->sin4.sin_family != AF_INET) {
    throw NetworkError("Can only set an IPv4 source address, not " + source->toString());
  }
#if defined(IP_PKTINFO)
  struct cmsghdr* cmsg = nullptr;
  struct in_pktinfo* pkt;

  msgh->msg_control = cmsgbuf;
  static_assert(CMSG_SPACE(sizeof(*pkt)) <= sizeof(*cmsgbuf), "Buffer is too small for in_pktinfo");
  msgh->msg_controllen = CMSG_SPACE(sizeof(*pkt));

  cmsg = CMSG_FIRSTHDR(msgh);
  cmsg->cmsg_level = IPPROTO_IP;
  cmsg->cmsg_type = IP_PKTINFO;
  cmsg->cmsg_len = CMSG_LEN(sizeof(*pkt));

  pkt = (struct in_pktinfo*)CMSG_DATA(cmsg);
  // Include the padding to stop valgrind complaining about passing uninitialized data
  memset(pkt, 0, CMSG_SPACE(sizeof(*pkt)));
  pkt->ipi_spec_dst = source->sin4.sin_addr;
  pkt->ipi_ifindex = itfIndex;
#else
  throw NetworkError("Setting the source address needs IP_PKTINFO, which this platform lacks");
#endif
}

NetworkInterface getNetworkInterfaceByIndex(unsigned int index)
{
  std::array<char, IF_NAMESIZE> name{};
  if (if_indextoname(index, name.data()) == nullptr) {
    throw NetworkError("Unable to find the name of interface " + std::to_string(index) + ": " + stringerror());
  }
  NetworkInterface ret;
  ret.index = index;
  ret.name = name.data();
  return ret;
}

#ifdef HAVE_GETIFADDRS
std::vector<ComboAddress> getListOfAddressesOfNetworkInterface(const std::string& itf)
{
  std::vector<ComboAddress> result;
  struct ifaddrs* ifaddr = nullptr;
  if (getifaddrs(&ifaddr) == -1) {
    return result;
  }

  for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
    if (ifa->ifa_name == nullptr || strcmp(ifa->ifa_name, itf.c_str()) != 0) {
      continue;
    }
    if (ifa->ifa_addr == nullptr || (ifa->ifa_addr->sa_family != AF_INET && ifa->ifa_addr->sa_family != AF_INET6)) {
      continue;
    }
    ComboAddress addr;
    try {
      addr.setSockaddr(ifa->ifa_addr, ifa->ifa_addr->sa_family == AF_INET ? sizeof(struct sockaddr_in) : sizeof(struct sockaddr_in6));
    }
    catch (const PXEProxyException&) {
      continue;
    }

    result.push_back(addr);
  }

  freeifaddrs(ifaddr);
  return result;
}
#else
std::vector<ComboAddress> getListOfAddressesOfNetworkInterface(const std::string& /* itf */)
{
  std::vector<ComboAddress> result;
  return result;
}
#endif // HAVE_GETIFADDRS
