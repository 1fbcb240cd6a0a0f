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
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <thread>
#include <unistd.h>

#include "arguments.hh"
#include "bootpolicy.hh"
#include "dhcpconn.hh"
#include "interfaceip.hh"
#include "logger.hh"
#include "machineevent.hh"
#include "misc.hh"
#include "proxydhcp.hh"
#include "pxeexception.hh"
#include "pxeresponder.hh"
#include "tftphandler.hh"
#include "tftpserver.hh"
#include "threadname.hh"

#ifndef PXEPROXY_VERSION
#define PXEPROXY_VERSION "unknown"
#endif

static std::atomic<bool> g_serverFailed{false};

ArgvMap& arg()
{
  static ArgvMap theArg;
  return theArg;
}

static void declareArguments()
{
  ::arg().set("config-file", "Read settings from this file, command line settings win") = "";
  ::arg().set("listen-address", "IPv4 address to listen on for DHCP, PXE and TFTP") = "0.0.0.0";
  ::arg().set("dhcp-port", "Port to listen on for ProxyDHCP requests") = std::to_string(BOOTP_SERVER_PORT);
  ::arg().set("pxe-port", "Port to listen on for PXE boot server requests") = std::to_string(PXE_SERVER_PORT);
  ::arg().set("tftp-port", "Port to listen on for TFTP read requests") = std::to_string(TFTP_PORT);
  ::arg().set("tftp-max-transfers", "Maximum number of TFTP transfers running at the same time") = std::to_string(TFTPServer::s_defaultMaxTransfers);
  ::arg().set("http-port", "Port of the HTTP server handing out iPXE scripts, used in the URL we give to iPXE") = "80";

  ::arg().set("ipxe-bios", "iPXE image for x86 BIOS PXE clients (undionly.kpxe)") = "";
  ::arg().set("ipxe-bios-ipxe", "iPXE image for x86 BIOS clients already running iPXE (ipxe.pxe)") = "";
  ::arg().set("ipxe-efi32", "iPXE image for 32 bit x86 EFI clients") = "";
  ::arg().set("ipxe-efi64", "iPXE image for 64 bit x86 EFI clients") = "";
  ::arg().set("ipxe-efibc", "iPXE image for EFI byte code clients") = "";
  ::arg().set("ipxe-arm64", "iPXE image for ARM64 EFI clients") = "";

  ::arg().set("kernel", "Kernel every machine boots") = "";
  ::arg().set("initrd", "Comma separated list of initrds every machine boots") = "";
  ::arg().set("cmdline", "Kernel command line") = "";
  ::arg().set("boot-message", "Message shown by iPXE while booting") = "";

  ::arg().set("loglevel", "Amount of logging, a syslog priority (0-7) or its name. 7 or 'debug' includes every ignored packet") = "6";
  ::arg().setSwitch("disable-syslog", "Disable logging to syslog, useful when running inside a supervisor that logs stderr") = "no";
  ::arg().setSwitch("log-timestamp", "Print timestamps in log lines") = "yes";
  ::arg().setSwitch("structured-logging", "Write console log lines as msg=\"..\" prio=\"..\"") = "no";
  ::arg().set("read-timeout", "Milliseconds a blocked receive waits before checking for shutdown") = "1000";

  ::arg().setSwitch("help", "Provide a helpful message") = "no";
  ::arg().setSwitch("version", "Output version and exit") = "no";
}

static uint16_t getPortSetting(const string& name)
{
  int port = ::arg().asNum(name);
  if (port <= 0 || port > 65535) {
    throw ArgException("'" + name + "' value '" + ::arg()[name] + "' is not a valid port");
  }
  return static_cast<uint16_t>(port);
}

static std::shared_ptr<const ImageMap> loadImages()
{
  const std::vector<std::pair<string, Firmware>> settings = {
    {"ipxe-bios", Firmware::X86PC},
    {"ipxe-bios-ipxe", Firmware::X86iPXE},
    {"ipxe-efi32", Firmware::EFI32},
    {"ipxe-efi64", Firmware::EFI64},
    {"ipxe-efibc", Firmware::EFIBC},
    {"ipxe-arm64", Firmware::EFIArm64},
  };

  auto images = std::make_shared<ImageMap>();
  for (const auto& setting : settings) {
    if (::arg().isEmpty(setting.first)) {
      continue;
    }
    const auto& fname = ::arg()[setting.first];
    (*images)[setting.second] = readFileToString(fname);
    g_log << Logger::Info << "Loaded " << toString(setting.second) << " image from '" << fname << "', " << images->at(setting.second).size() << " bytes" << endl;
  }
  if (images->empty()) {
    g_log << Logger::Warning << "No iPXE images configured, TFTP requests will all fail" << endl;
  }
  return images;
}

static BootSpec getBootSpecSetting()
{
  BootSpec spec;
  spec.kernel = ::arg()["kernel"];
  vector<string> initrds;
  stringtok(initrds, ::arg()["initrd"], ", \t");
  spec.initrds = initrds;
  spec.cmdline = ::arg()["cmdline"];
  spec.message = ::arg()["boot-message"];
  return spec;
}

// runs one of the servers, a failure takes the whole process down
static std::thread startServer(const string& threadName, std::function<void()> serve)
{
  return std::thread([threadName, serve]() {
    setThreadName(threadName);
    try {
      serve();
      return;
    }
    catch (const NetworkError& e) {
      g_log << Logger::Critical << "Server " << threadName << " failed: " << e.what() << endl;
    }
    catch (const PXEProxyException& e) {
      g_log << Logger::Critical << "Server " << threadName << " failed: " << e.reason << endl;
    }
    catch (const std::exception& e) {
      g_log << Logger::Critical << "Server " << threadName << " failed: " << e.what() << endl;
    }
    g_serverFailed = true;
    kill(getpid(), SIGTERM);
  });
}

int main(int argc, char** argv)
{
  std::ios_base::sync_with_stdio(false);

  g_log.toConsole(Logger::Warning);
  g_log.setName("pxeproxy");
  try {
    declareArguments();

    ::arg().laxParse(argc, argv); // do a lax parse

    if (::arg().mustDo("help")) {
      cout << "syntax:" << endl
           << endl;
      cout << ::arg().helpstring() << endl;
      return 0;
    }
    if (::arg().mustDo("version")) {
      cout << "pxeproxy " << PXEPROXY_VERSION << endl;
      return 0;
    }

    if (!::arg().isEmpty("config-file")) {
      if (!::arg().file(::arg()["config-file"])) {
        g_log << Logger::Error << "Unable to open configuration file '" << ::arg()["config-file"] << "': " << stringerror() << endl;
        return EXIT_FAILURE;
      }
    }
    ::arg().parse(argc, argv); // reparse so the commandline still wins, and complain about typos

    auto loglevel = Logger::parseUrgency(::arg()["loglevel"]);
    if (!loglevel) {
      throw ArgException("'loglevel' value '" + ::arg()["loglevel"] + "' is not a syslog priority");
    }
    g_log.setLoglevel(*loglevel);
    g_log.disableSyslog(::arg().mustDo("disable-syslog"));
    g_log.setTimestamps(::arg().mustDo("log-timestamp"));
    g_log.setPrefixed(::arg().mustDo("structured-logging"));
    g_log.toConsole(*loglevel);

    if (::arg().isEmpty("kernel")) {
      throw ArgException("no kernel configured, set 'kernel'");
    }
    int timeoutMS = ::arg().asNum("read-timeout");
    if (timeoutMS <= 0) {
      throw ArgException("'read-timeout' must be positive");
    }
    const struct timeval readTimeout = {timeoutMS / 1000, (timeoutMS % 1000) * 1000};
    int maxTransfers = ::arg().asNum("tftp-max-transfers");
    if (maxTransfers <= 0) {
      throw ArgException("'tftp-max-transfers' must be positive");
    }

    auto events = std::make_shared<LoggerEventSink>();
    auto policy = std::make_shared<StaticBootPolicy>(getBootSpecSetting());
    auto dispatcher = std::make_shared<TFTPImageDispatcher>(loadImages(), events);

    // the only transport there is, but tests and other platforms get to pick their own
    DHCPConnFactory connFactory = makeUDPDHCPConn;

    ComboAddress listenAddress(::arg()["listen-address"]);
    ComboAddress dhcpAddress(listenAddress);
    dhcpAddress.setPort(getPortSetting("dhcp-port"));
    ComboAddress pxeAddress(listenAddress);
    pxeAddress.setPort(getPortSetting("pxe-port"));
    ComboAddress tftpAddress(listenAddress);
    tftpAddress.setPort(getPortSetting("tftp-port"));

    ProxyDHCPServer dhcp(connFactory(dhcpAddress), policy, events, resolveInterfaceAddress, getPortSetting("http-port"), readTimeout);
    PXEResponder pxe(connFactory(pxeAddress), events, resolveInterfaceAddress, readTimeout);
    TFTPServer tftp(
      tftpAddress,
      [dispatcher](const string& path, const ComboAddress& peer) {
        return dispatcher->open(path, peer);
      },
      [dispatcher](const ComboAddress& peer, const string& path, const std::optional<string>& error) {
        dispatcher->logTransfer(peer, path, error);
      },
      readTimeout, static_cast<size_t>(maxTransfers));

    // only this thread gets to see the signals, through sigwait
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
      unixDie("Blocking signals");
    }

    g_log << Logger::Warning << "pxeproxy " << PXEPROXY_VERSION << " listening on " << dhcpAddress << " (ProxyDHCP), " << pxeAddress << " (PXE) and " << tftpAddress << " (TFTP)" << endl;

    vector<std::thread> threads;
    threads.push_back(startServer("pxe/dhcp", [&dhcp]() { dhcp.serve(); }));
    threads.push_back(startServer("pxe/pxe", [&pxe]() { pxe.serve(); }));
    threads.push_back(startServer("pxe/tftp", [&tftp]() { tftp.serve(); }));

    int sig = 0;
    if (sigwait(&signals, &sig) != 0) {
      unixDie("Waiting for signals");
    }
    if (!g_serverFailed) {
      g_log << Logger::Warning << "Received signal " << sig << ", shutting down" << endl;
    }

    dhcp.stop();
    pxe.stop();
    tftp.stop();
    for (auto& thread : threads) {
      thread.join();
    }
  }
  catch (const PXEProxyException& e) {
    g_log << Logger::Error << "Fatal error: " << e.reason << endl;
    return EXIT_FAILURE;
  }
  catch (const std::exception& e) {
    g_log << Logger::Error << "Fatal error: " << e.what() << endl;
    return EXIT_FAILURE;
  }

  return g_serverFailed ? EXIT_FAILURE : EXIT_SUCCESS;
}
