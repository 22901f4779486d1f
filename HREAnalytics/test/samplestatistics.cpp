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
#include <hrea/engine/samplestatistics.hpp>
#include <hret/toplevelfixture.hpp>

#include <cmath>
#include <limits>

using namespace hre::analytics;
using QuantLib::Array;

BOOST_FIXTURE_TEST_SUITE(HREAnalyticsTestSuite, hre::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(SampleStatisticsTest)

BOOST_AUTO_TEST_CASE(testStatistics) {

    BOOST_TEST_MESSAGE("Testing mean, standard deviation and standard error...");

    Array samples(4);
    samples[0] = 1.0;
    samples[1] = 2.0;
    samples[2] = 3.0;
    samples[3] = 6.0;
    SampleStatistics s = sampleStatistics(samples, 4);
    BOOST_CHECK_CLOSE(s.mean, 3.0, 1e-8);
    // population variance (4 + 1 + 0 + 9) / 4
    BOOST_CHECK_CLOSE(s.stdDev, std::sqrt(3.5), 1e-8);
    BOOST_CHECK_CLOSE(s.stdErr, std::sqrt(3.5) / 2.0, 1e-8);

    SampleStatistics flat = sampleStatistics(Array(10, 2.5), 10);
    BOOST_CHECK_CLOSE(flat.mean, 2.5, 1e-8);
    BOOST_CHECK_SMALL(flat.stdDev, 1e-12);
    BOOST_CHECK_SMALL(flat.stdErr, 1e-12);

    BOOST_CHECK_THROW(sampleStatistics(Array(), 1), QuantLib::Error);
    BOOST_CHECK_THROW(sampleStatistics(samples, 0), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testAllFinite) {

    BOOST_TEST_MESSAGE("Testing the finiteness check...");

    Array samples(3, 1.0);
    BOOST_CHECK(allFinite(samples));
    samples[1] = std::numeric_limits<double>::infinity();
    BOOST_CHECK(!allFinite(samples));
    samples[1] = std::numeric_limits<double>::quiet_NaN();
    BOOST_CHECK(!allFinite(samples));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
