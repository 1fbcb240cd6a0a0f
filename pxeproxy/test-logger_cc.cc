#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#ifdef HAVE_CONFIG_H
#include "config.h"
#endif
#include <thread>
#include <boost/test/unit_test.hpp>

#include "logger.hh"

BOOST_AUTO_TEST_SUITE(test_logger_cc)

BOOST_AUTO_TEST_CASE(test_parseUrgency)
{
  BOOST_CHECK(Logger::parseUrgency("6") == Logger::Info);
  BOOST_CHECK(Logger::parseUrgency("7") == Logger::Debug);
  BOOST_CHECK(Logger::parseUrgency("0") == Logger::Urgency(LOG_EMERG));
  BOOST_CHECK(Logger::parseUrgency("debug") == Logger::Debug);
  BOOST_CHECK(Logger::parseUrgency("Warning") == Logger::Warning);
  BOOST_CHECK(Logger::parseUrgency("none") == Logger::None);
  BOOST_CHECK(Logger::parseUrgency("32767") == Logger::All);

  BOOST_CHECK(!Logger::parseUrgency(""));
  BOOST_CHECK(!Logger::parseUrgency("8"));
  BOOST_CHECK(!Logger::parseUrgency("-1"));
  BOOST_CHECK(!Logger::parseUrgency("verbose"));
  BOOST_CHECK(!Logger::parseUrgency("99999999999"));
}

BOOST_AUTO_TEST_CASE(test_toString)
{
  BOOST_CHECK_EQUAL(Logger::toString(Logger::Error), "error");
  BOOST_CHECK_EQUAL(Logger::toString(Logger::Debug), "debug");
  BOOST_CHECK_EQUAL(Logger::toString(Logger::Urgency(LOG_EMERG)), "0");
}

BOOST_AUTO_TEST_CASE(test_thread_lines)
{
  // nothing reaches the console in tests, this exercises the per-thread buffers
  std::thread other([]() {
    g_log.setThreadComponent("pxe/test");
    g_log << Logger::Debug << "from " << "another thread" << endl;
  });
  g_log << Logger::Debug << "from the test thread" << endl;
  other.join();
}

BOOST_AUTO_TEST_SUITE_END()
