#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK
#endif

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <boost/test/unit_test.hpp>
#include "arguments.hh"
#include "logger.hh"

ArgvMap& arg()
{
  static ArgvMap theArg;
  return theArg;
}

static bool init_unit_test()
{
  // the servers log every dropped packet, keep the test output readable
  g_log.toConsole(Logger::Critical);
  g_log.disableSyslog(true);
  return true;
}

// entry point:
int main(int argc, char* argv[])
{
  setenv("BOOST_TEST_RANDOM", "1", 1); // NOLINT(concurrency-mt-unsafe)
  return boost::unit_test::unit_test_main(&init_unit_test, argc, argv);
}
