#pragma once

#include <deque>
#include <mutex>
#include <optional>
#include <tuple>
#include <vector>

#include "bootpolicy.hh"
#include "dhcpconn.hh"
#include "machineevent.hh"
#include "pxeexception.hh"

//! A DHCPConn that hands out queued packets and records what gets sent
class FakeDHCPConn : public DHCPConn
{
public:
  struct Sent
  {
    DHCPPacket packet;
    ComboAddress dest;
    NetworkInterface itf;
  };

  void queue(const DHCPPacket& packet, const NetworkInterface& itf, const ComboAddress& remote = ComboAddress("0.0.0.0", 68))
  {
    d_incoming.emplace_back(packet, itf, remote);
  }

  using DHCPConn::recv;
  std::pair<DHCPPacket, NetworkInterface> recv(ComboAddress& remote) override
  {
    if (d_incoming.empty()) {
      if (d_failReceive) {
        throw NetworkError("socket went away");
      }
      throw TimeoutException("recvmsg timed out");
    }
    auto incoming = d_incoming.front();
    d_incoming.pop_front();
    remote = std::get<2>(incoming);
    return {std::get<0>(incoming), std::get<1>(incoming)};
  }

  void sendTo(const DHCPPacket& packet, const ComboAddress& dest, const NetworkInterface& itf) override
  {
    if (d_failSend) {
      throw NetworkError("sendmsg failed");
    }
    // through the wire format, so what the tests look at is what a client would see
    d_sent.push_back({DHCPPacket::decode(packet.encode()), dest, itf});
  }

  void setReadTimeout(const struct timeval& timeout) override
  {
    d_readTimeout = timeout;
  }

  void close() override
  {
    d_closed = true;
  }

  std::deque<std::tuple<DHCPPacket, NetworkInterface, ComboAddress>> d_incoming;
  std::vector<Sent> d_sent;
  struct timeval d_readTimeout{0, 0};
  bool d_failReceive{false};
  bool d_failSend{false};
  bool d_closed{false};
};

class RecordingEventSink : public EventSink
{
public:
  struct Event
  {
    MACAddress mac;
    MachineState state;
    string message;
  };

  void machineEvent(const MACAddress& mac, MachineState state, const string& message) override
  {
    std::lock_guard<std::mutex> lock(d_mutex);
    d_events.push_back({mac, state, message});
  }

  struct Failure
  {
    ComboAddress peer;
    string path;
    string error;
  };

  void transferFailed(const ComboAddress& peer, const string& path, const string& error) override
  {
    std::lock_guard<std::mutex> lock(d_mutex);
    d_failures.push_back({peer, path, error});
  }

  std::vector<Event> getEvents()
  {
    std::lock_guard<std::mutex> lock(d_mutex);
    return d_events;
  }

  std::vector<Failure> getFailures()
  {
    std::lock_guard<std::mutex> lock(d_mutex);
    return d_failures;
  }

private:
  std::mutex d_mutex;
  std::vector<Event> d_events;
  std::vector<Failure> d_failures;
};

//! Boots everything, nothing, or fails, depending on what the test wants
class FakeBootPolicy : public BootPolicy
{
public:
  std::optional<BootSpec> getBootSpec(const Machine& machine) override
  {
    d_asked.push_back(machine);
    if (d_fail) {
      throw PXEProxyException("policy backend unreachable");
    }
    if (!d_boot) {
      return std::nullopt;
    }
    BootSpec spec;
    spec.kernel = "/boot/vmlinuz";
    return spec;
  }

  std::vector<Machine> d_asked;
  bool d_boot{true};
  bool d_fail{false};
};

static inline NetworkInterface makeInterface(unsigned int index = 2, const string& name = "eth0")
{
  NetworkInterface itf;
  itf.index = index;
  itf.name = name;
  return itf;
}

static inline DHCPPacket makeBootRequest(const string& mac, uint16_t arch, DHCPMessageType type = DHCPMessageType::Discover)
{
  DHCPPacket packet;
  packet.type = type;
  packet.xid = 0x12345678;
  packet.chaddr = MACAddress::parse(mac);
  packet.options.setUint16(DHCP_OPTION_CLIENT_ARCH, arch);
  return packet;
}

static inline string makeGUID(uint8_t leading)
{
  string guid(17, '\x42');
  guid.at(0) = static_cast<char>(leading);
  return guid;
}
