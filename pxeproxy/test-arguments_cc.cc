#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#ifdef HAVE_CONFIG_H
#include "config.h"
#endif
#include <stdlib.h>
#include <unistd.h>
#include <boost/test/unit_test.hpp>
#include "arguments.hh"
#include "namespaces.hh"

BOOST_AUTO_TEST_SUITE(test_arguments_cc)

BOOST_AUTO_TEST_CASE(test_file_parse)
{
  char path[] = "/tmp/pxeproxy-test-conf.XXXXXX";
  int fd = mkstemp(path);
  if (fd < 0)
    BOOST_FAIL("Unable to generate a temporary file");

  string config =
    R"(kernel=/srv/boot/vmlinuz=x
cmdline=console=ttyS0 \
quiet
boot-message=here # and here it stops
disable-syslog=no
log-timestamp=on
# dhcp-port=1067
tftp-port=1069)";

  ssize_t len = write(fd, config.c_str(), config.size());

  BOOST_CHECK_EQUAL(len, static_cast<ssize_t>(config.size()));
  if (!len)
    return;
  close(fd);

  try {
    ArgvMap arg;
    for (auto& a : {"kernel", "cmdline", "boot-message", "disable-syslog", "log-timestamp", "tftp-port"})
      arg.set(a, a);
    arg.set("dhcp-port", "port for DHCP") = "67";
    arg.file(path);
    unlink(path);

    BOOST_CHECK_EQUAL(arg["kernel"], "/srv/boot/vmlinuz=x");
    BOOST_CHECK_EQUAL(arg["cmdline"], "console=ttyS0 quiet");
    BOOST_CHECK_EQUAL(arg["boot-message"], "here");
    BOOST_CHECK_EQUAL(arg.mustDo("disable-syslog"), false);
    BOOST_CHECK_EQUAL(arg.mustDo("log-timestamp"), true);
    BOOST_CHECK_EQUAL(arg.asNum("tftp-port"), 1069);
    BOOST_CHECK_EQUAL(arg.asNum("dhcp-port"), 67);
  }
  catch (PXEProxyException& e) {
    unlink(path);
    cerr << "Exception: " << e.reason << endl;
    BOOST_FAIL("Exception: " + e.reason);
  }
}

BOOST_AUTO_TEST_CASE(test_argv_parse)
{
  ArgvMap arg;
  arg.set("listen-address", "address") = "0.0.0.0";
  arg.set("initrd", "initrds") = "";
  arg.setSwitch("help", "help") = "no";

  std::vector<string> args = {"pxeproxy", "--listen-address=10.0.0.1", "--initrd+=/a.img", "--initrd+=/b.img", "--help"};
  std::vector<char*> argv;
  for (auto& a : args) {
    argv.push_back(&a.at(0));
  }
  int argc = static_cast<int>(argv.size());
  arg.parse(argc, argv.data());

  BOOST_CHECK_EQUAL(arg["listen-address"], "10.0.0.1");
  BOOST_CHECK_EQUAL(arg["initrd"], "/a.img, /b.img");
  BOOST_CHECK(arg.mustDo("help"));

  std::vector<string> unknown = {"pxeproxy", "--no-such-setting=1"};
  argv.clear();
  for (auto& a : unknown) {
    argv.push_back(&a.at(0));
  }
  argc = static_cast<int>(argv.size());
  BOOST_CHECK_THROW(arg.parse(argc, argv.data()), ArgException);
  BOOST_CHECK_NO_THROW(arg.laxParse(argc, argv.data()));
  BOOST_CHECK_THROW(arg["no-such-setting"], ArgException);
}

BOOST_AUTO_TEST_SUITE_END()
