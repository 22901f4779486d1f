/*
 Copyright (C) 2026 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of HRE, a free-software/open-source library
 for hedge analytics of Monte Carlo contract valuations

 HRE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

#include <boost/algorithm/string/predicate.hpp>
#include <boost/test/unit_test.hpp>
#include <hred/utilities/log.hpp>
#include <hret/toplevelfixture.hpp>

using namespace hre::data;
using std::string;

namespace {

// Register a buffer logger and switch the log on with the given mask
QuantLib::ext::shared_ptr<BufferLogger> bufferLog(unsigned mask) {
    auto logger = QuantLib::ext::make_shared<BufferLogger>(HRE_DATA);
    Log::instance().registerLogger(logger);
    Log::instance().setMask(mask);
    Log::instance().switchOn();
    return logger;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(HREDataTestSuite, hre::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(LogTests)

BOOST_AUTO_TEST_CASE(testMaskFiltering) {

    BOOST_TEST_MESSAGE("Testing log mask filtering...");

    auto logger = bufferLog(HRE_ALERT | HRE_WARNING);

    ALOG("an alert");
    WLOG("a warning");
    LOG("a notice");
    DLOG("a debug message");

    BOOST_REQUIRE(logger->hasNext());
    string msg = logger->next();
    BOOST_CHECK(boost::algorithm::contains(msg, "ALERT"));
    BOOST_CHECK(boost::algorithm::ends_with(msg, "an alert"));
    BOOST_REQUIRE(logger->hasNext());
    msg = logger->next();
    BOOST_CHECK(boost::algorithm::contains(msg, "WARNING"));
    BOOST_CHECK(boost::algorithm::ends_with(msg, "a warning"));
    BOOST_CHECK(!logger->hasNext());
    BOOST_CHECK_THROW(logger->next(), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testSwitchOff) {

    BOOST_TEST_MESSAGE("Testing that a switched off log is silent...");

    auto logger = bufferLog(255);
    Log::instance().switchOff();
    ALOG("not logged");
    BOOST_CHECK(!logger->hasNext());

    Log::instance().switchOn();
    ALOG("logged");
    BOOST_CHECK(logger->hasNext());
}

BOOST_AUTO_TEST_CASE(testBufferLoggerMinLevel) {

    BOOST_TEST_MESSAGE("Testing buffer logger minimum level...");

    auto logger = QuantLib::ext::make_shared<BufferLogger>(HRE_ERROR);
    Log::instance().registerLogger(logger);
    Log::instance().setMask(255);
    Log::instance().switchOn();

    ELOG("an error");
    WLOG("a warning");

    BOOST_REQUIRE(logger->hasNext());
    BOOST_CHECK(boost::algorithm::ends_with(logger->next(), "an error"));
    BOOST_CHECK(!logger->hasNext());
}

BOOST_AUTO_TEST_CASE(testLoggerRegistry) {

    BOOST_TEST_MESSAGE("Testing logger registration...");

    bufferLog(255);
    BOOST_CHECK(Log::instance().hasLogger(BufferLogger::name));
    BOOST_CHECK_EQUAL(Log::instance().logger(BufferLogger::name)->name(), BufferLogger::name);
    BOOST_CHECK_THROW(Log::instance().registerLogger(QuantLib::ext::make_shared<BufferLogger>()), QuantLib::Error);

    Log::instance().removeLogger(BufferLogger::name);
    BOOST_CHECK(!Log::instance().hasLogger(BufferLogger::name));
    BOOST_CHECK_THROW(Log::instance().removeLogger(BufferLogger::name), QuantLib::Error);
    BOOST_CHECK_THROW(Log::instance().logger(BufferLogger::name), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testStructuredMessage) {

    BOOST_TEST_MESSAGE("Testing structured messages...");

    StructuredMessage m(StructuredMessage::Category::Error, StructuredMessage::Group::Valuation,
                        "price \"OIL\" missing", {{"key", "OIL-2020-1"}});
    BOOST_CHECK_EQUAL(m.msg(), "{ \"category\": \"Error\", \"group\": \"Valuation\", \"message\": "
                               "\"price \\\"OIL\\\" missing\", \"sub_fields\": [ { \"name\": \"key\", "
                               "\"value\": \"OIL-2020-1\" } ] }");

    auto logger = bufferLog(HRE_ALERT | HRE_WARNING);
    m.log();
    StructuredMessage(StructuredMessage::Category::Warning, StructuredMessage::Group::Configuration, "check")
        .log();

    BOOST_REQUIRE(logger->hasNext());
    string msg = logger->next();
    BOOST_CHECK(boost::algorithm::contains(msg, "ALERT"));
    BOOST_CHECK(boost::algorithm::contains(msg, "StructuredErrorMessage"));
    BOOST_REQUIRE(logger->hasNext());
    msg = logger->next();
    BOOST_CHECK(boost::algorithm::contains(msg, "StructuredWarningMessage"));
    BOOST_CHECK(boost::algorithm::contains(msg, "\"group\": \"Configuration\""));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
