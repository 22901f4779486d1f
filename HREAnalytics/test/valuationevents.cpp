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

#include <boost/test/unit_test.hpp>
#include <hrea/valuation/valuationevents.hpp>
#include <hret/toplevelfixture.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace hre::analytics;
using QuantLib::Size;

namespace {

bool isResult(const ValuationEvent& e) { return e.type == ValuationEvent::Type::ResultCreated; }

bool any(const ValuationEvent&) { return true; }

} // namespace

BOOST_FIXTURE_TEST_SUITE(HREAnalyticsTestSuite, hre::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(ValuationEventsTest)

BOOST_AUTO_TEST_CASE(testFilteredDispatch) {

    BOOST_TEST_MESSAGE("Testing that handlers only receive events accepted by their filter...");

    ValuationEventBroker broker;
    std::vector<std::string> results;
    Size units = 0;
    broker.subscribe(isResult, [&results](const ValuationEvent& e) { results.push_back(e.id); });
    broker.subscribe(
        [](const ValuationEvent& e) { return e.type == ValuationEvent::Type::UnitOfWorkCompleted; },
        [&units](const ValuationEvent&) { ++units; });
    BOOST_CHECK_EQUAL(broker.subscriptions(), 2);

    broker.publish(ValuationEvent(ValuationEvent::Type::UnitOfWorkCompleted, "valuation-1"));
    broker.publish(ValuationEvent(ValuationEvent::Type::UnitOfWorkCompleted, "valuation-1"));
    broker.publish(ValuationEvent(ValuationEvent::Type::ResultCreated, "valuation-1#spec-1"));

    BOOST_CHECK_EQUAL(units, 2);
    BOOST_REQUIRE_EQUAL(results.size(), 1);
    BOOST_CHECK_EQUAL(results[0], "valuation-1#spec-1");
}

BOOST_AUTO_TEST_CASE(testUnsubscribe) {

    BOOST_TEST_MESSAGE("Testing unsubscribe and scoped subscriptions...");

    ValuationEventBroker broker;
    Size calls = 0;
    Size id = broker.subscribe(any, [&calls](const ValuationEvent&) { ++calls; });
    broker.publish(ValuationEvent(ValuationEvent::Type::UnitOfWorkCompleted));
    broker.unsubscribe(id);
    broker.publish(ValuationEvent(ValuationEvent::Type::UnitOfWorkCompleted));
    BOOST_CHECK_EQUAL(calls, 1);
    BOOST_CHECK_EQUAL(broker.subscriptions(), 0);

    // unknown and already removed ids are ignored
    BOOST_CHECK_NO_THROW(broker.unsubscribe(id));
    BOOST_CHECK_NO_THROW(broker.unsubscribe(42));

    {
        ScopedSubscription s(broker, any, [&calls](const ValuationEvent&) { ++calls; });
        BOOST_CHECK(s.active());
        BOOST_CHECK_EQUAL(broker.subscriptions(), 1);
        broker.publish(ValuationEvent(ValuationEvent::Type::UnitOfWorkCompleted));
        s.release();
        BOOST_CHECK(!s.active());
        BOOST_CHECK_EQUAL(broker.subscriptions(), 0);
        // a second release does nothing
        s.release();
    }
    {
        ScopedSubscription s(broker, any, [&calls](const ValuationEvent&) { ++calls; });
    }
    BOOST_CHECK_EQUAL(broker.subscriptions(), 0);
    broker.publish(ValuationEvent(ValuationEvent::Type::UnitOfWorkCompleted));
    BOOST_CHECK_EQUAL(calls, 2);
}

BOOST_AUTO_TEST_CASE(testFailingHandler) {

    BOOST_TEST_MESSAGE("Testing that a failing handler does not stop the dispatch...");

    ValuationEventBroker broker;
    Size calls = 0;
    broker.subscribe(any, [](const ValuationEvent&) { throw std::runtime_error("handler failed"); });
    broker.subscribe(any, [&calls](const ValuationEvent&) { ++calls; });
    BOOST_CHECK_NO_THROW(broker.publish(ValuationEvent(ValuationEvent::Type::ResultCreated, "r")));
    BOOST_CHECK_EQUAL(calls, 1);
}

BOOST_AUTO_TEST_CASE(testNoHandlerAfterUnsubscribe) {

    BOOST_TEST_MESSAGE("Testing that no handler runs once unsubscribe has returned...");

    ValuationEventBroker broker;
    std::atomic<bool> unsubscribed(false), lateCall(false), stop(false);
    Size id = broker.subscribe(any, [&unsubscribed, &lateCall](const ValuationEvent&) {
        if (unsubscribed)
            lateCall = true;
    });

    std::vector<std::thread> producers;
    for (Size i = 0; i < 4; ++i) {
        producers.emplace_back([&broker, &stop]() {
            while (!stop)
                broker.publish(ValuationEvent(ValuationEvent::Type::UnitOfWorkCompleted));
        });
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    broker.unsubscribe(id);
    unsubscribed = true;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    stop = true;
    for (auto& t : producers)
        t.join();

    BOOST_CHECK(!lateCall);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
