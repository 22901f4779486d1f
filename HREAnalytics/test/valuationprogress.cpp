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
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/test/unit_test.hpp>
#include <hrea/engine/valuationprogress.hpp>
#include <hret/toplevelfixture.hpp>
#include <ql/utilities/null.hpp>

#include <sstream>
#include <thread>
#include <vector>

using namespace hre::analytics;
using boost::posix_time::ptime;
using boost::posix_time::seconds;
using QuantLib::Null;
using QuantLib::Real;
using QuantLib::Size;
using std::string;

namespace {

const ptime t0(boost::gregorian::date(2020, 1, 1));

// Keeps the last update it received
class LastUpdate : public hre::data::ProgressIndicator {
public:
    void updateProgress(const unsigned long progress, const unsigned long total, const string& detail) override {
        this->progress = progress;
        this->total = total;
        this->detail = detail;
        ++updates;
    }
    void reset() override {}

    unsigned long progress = 0, total = 0;
    string detail;
    Size updates = 0;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(HREAnalyticsTestSuite, hre::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(ValuationProgressTest)

BOOST_AUTO_TEST_CASE(testRateAndEta) {

    BOOST_TEST_MESSAGE("Testing rate and eta from evenly spaced completions...");

    ValuationProgressTracker tracker(100);
    auto indicator = QuantLib::ext::make_shared<LastUpdate>();
    tracker.registerProgressIndicator(indicator);

    for (int i = 0; i < 50; ++i)
        tracker.onUnitCompleted(t0 + seconds(i));

    ProgressSnapshot s = tracker.snapshot();
    BOOST_CHECK_EQUAL(s.completed, 50);
    BOOST_CHECK_EQUAL(s.total, 100);
    BOOST_CHECK_CLOSE(s.percent, 50.0, 1e-10);
    BOOST_CHECK_CLOSE(s.rate, 1.0, 1e-10);
    BOOST_CHECK_CLOSE(s.eta, 50.0, 1e-10);

    BOOST_CHECK_EQUAL(indicator->updates, 50);
    BOOST_CHECK_EQUAL(indicator->progress, 50);
    BOOST_CHECK_EQUAL(indicator->total, 100);
    BOOST_CHECK_EQUAL(indicator->detail, "50.00% complete (50/100) 1.00/s eta 50s");
}

BOOST_AUTO_TEST_CASE(testWindowIsBounded) {

    BOOST_TEST_MESSAGE("Testing that the rate window never exceeds its capacity...");

    ValuationProgressTracker tracker(10);
    BOOST_CHECK_EQUAL(tracker.windowCapacity(), 5);
    for (int i = 0; i < 8; ++i) {
        // slow start, then one unit every 2 seconds
        tracker.onUnitCompleted(t0 + seconds(i < 3 ? 100 * i : 200 + 2 * i));
        BOOST_CHECK(tracker.windowSize() <= tracker.windowCapacity());
    }
    BOOST_CHECK_EQUAL(tracker.windowSize(), 5);
    // only the last five completions, 2 seconds apart, enter the rate
    BOOST_CHECK_CLOSE(tracker.snapshot().rate, 0.5, 1e-10);
    BOOST_CHECK_CLOSE(tracker.snapshot().eta, 4.0, 1e-10);

    BOOST_CHECK_EQUAL(ValuationProgressTracker(1).windowCapacity(), 1);
    BOOST_CHECK_EQUAL(ValuationProgressTracker(3).windowCapacity(), 1);
    BOOST_CHECK_EQUAL(ValuationProgressTracker(100, 0.1).windowCapacity(), 10);
}

BOOST_AUTO_TEST_CASE(testFallbackRate) {

    BOOST_TEST_MESSAGE("Testing the fallback rate...");

    ValuationProgressTracker tracker(10, 0.5, 0.25);
    tracker.onUnitCompleted(t0);
    ProgressSnapshot s = tracker.snapshot();
    BOOST_CHECK_CLOSE(s.rate, 0.25, 1e-10);
    BOOST_CHECK_CLOSE(s.eta, 36.0, 1e-10);

    // completions at the same instant span no time
    tracker.onUnitCompleted(t0);
    BOOST_CHECK_CLOSE(tracker.snapshot().rate, 0.25, 1e-10);

    BOOST_CHECK_THROW(ValuationProgressTracker(10, 0.5, 0.0), QuantLib::Error);
    BOOST_CHECK_THROW(ValuationProgressTracker(10, -0.5), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testZeroTotalCost) {

    BOOST_TEST_MESSAGE("Testing a valuation without units of work...");

    ValuationProgressTracker tracker(0);
    ProgressSnapshot s = tracker.snapshot();
    BOOST_CHECK_EQUAL(s.percent, 100.0);
    BOOST_CHECK(s.rate == Null<Real>());
    BOOST_CHECK(s.eta == Null<Real>());
    std::ostringstream out;
    out << s;
    BOOST_CHECK_EQUAL(out.str(), "100.00% complete (0/0)");
}

BOOST_AUTO_TEST_CASE(testConcurrentProducers) {

    BOOST_TEST_MESSAGE("Testing completions reported from several threads...");

    Size ticks = 0;
    ValuationProgressTracker tracker(400, 0.5, 0.001, [&ticks]() { return t0 + seconds(static_cast<long>(ticks++)); });
    std::vector<std::thread> producers;
    for (int i = 0; i < 4; ++i)
        producers.emplace_back([&tracker]() {
            for (int j = 0; j < 100; ++j)
                tracker.onUnitCompleted();
        });
    for (auto& t : producers)
        t.join();

    BOOST_CHECK_EQUAL(tracker.completed(), 400);
    BOOST_CHECK_EQUAL(tracker.windowSize(), 200);
    // the clock is read under the lock, so the window holds 200 consecutive ticks
    BOOST_CHECK_CLOSE(tracker.snapshot().rate, 1.0, 1e-10);
    BOOST_CHECK_EQUAL(tracker.snapshot().eta, 0.0);
}

BOOST_AUTO_TEST_CASE(testUnitOfWorkFilter) {

    BOOST_TEST_MESSAGE("Testing the unit of work event filter...");

    BOOST_CHECK(ValuationProgressTracker::isUnitOfWorkCompleted(
        ValuationEvent(ValuationEvent::Type::UnitOfWorkCompleted, "valuation-1")));
    BOOST_CHECK(!ValuationProgressTracker::isUnitOfWorkCompleted(
        ValuationEvent(ValuationEvent::Type::ResultCreated, "valuation-1#spec-1")));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
