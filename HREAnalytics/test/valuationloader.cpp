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
#include <hrea/valuation/valuationloader.hpp>
#include <hret/datapaths.hpp>
#include <hret/toplevelfixture.hpp>

using namespace hre::analytics;
using QuantLib::Array;
using QuantLib::Date;
using QuantLib::Real;

BOOST_FIXTURE_TEST_SUITE(HREAnalyticsTestSuite, hre::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(ValuationLoaderTest)

BOOST_AUTO_TEST_CASE(testLoadSampledValuation) {

    BOOST_TEST_MESSAGE("Testing loading a valuation with per path fair values...");

    ValuationCsvLoader loader(TEST_INPUT_FILE("fairvalue.csv"), TEST_INPUT_FILE("perturbed.csv"),
                              TEST_INPUT_FILE("prices.csv"), TEST_INPUT_FILE("callcosts.csv"));

    const ValuationResult& result = loader.result();
    BOOST_REQUIRE(result.hasFairValueSamples());
    const Array& fv = boost::get<Array>(result.fairValue);
    BOOST_REQUIRE_EQUAL(fv.size(), 3);
    // rows are ordered by path
    BOOST_CHECK_EQUAL(fv[0], 101.5);
    BOOST_CHECK_EQUAL(fv[1], 100.5);
    BOOST_CHECK_EQUAL(fv[2], 99.0);

    BOOST_REQUIRE_EQUAL(result.perturbedValues.size(), 4);
    BOOST_CHECK_EQUAL(result.perturbedValues.at("-OIL-2020-1")[2], 94.0);
    BOOST_CHECK_EQUAL(result.perturbedValues.at("OIL").size(), 3);

    BOOST_REQUIRE_EQUAL(loader.simulatedPrices().size(), 2);
    const SimulatedPrice& spot = loader.simulatedPrices().front();
    BOOST_CHECK_EQUAL(spot.commodity, "OIL");
    BOOST_CHECK_EQUAL(spot.date, Date(15, QuantLib::December, 2019));
    BOOST_CHECK_EQUAL(spot.value[1], 50.0);
    BOOST_CHECK_EQUAL(loader.simulatedPrices().back().date, Date(1, QuantLib::January, 2020));

    BOOST_REQUIRE_EQUAL(loader.callCosts().size(), 3);
    BOOST_CHECK_EQUAL(loader.callCosts().at("leg-1"), 10);
}

BOOST_AUTO_TEST_CASE(testLoadScalarFairValue) {

    BOOST_TEST_MESSAGE("Testing loading a valuation with a scalar fair value...");

    ValuationCsvLoader loader(TEST_INPUT_FILE("fairvalue_scalar.csv"), TEST_INPUT_FILE("perturbed.csv"),
                              TEST_INPUT_FILE("prices.csv"), TEST_INPUT_FILE("callcosts.csv"));
    BOOST_CHECK(!loader.result().hasFairValueSamples());
    BOOST_CHECK_EQUAL(boost::get<Real>(loader.result().fairValue), 100.25);
}

BOOST_AUTO_TEST_CASE(testInvalidInput) {

    BOOST_TEST_MESSAGE("Testing invalid valuation input files...");

    BOOST_CHECK_THROW(ValuationCsvLoader(TEST_INPUT_FILE("fairvalue.csv"), TEST_INPUT_FILE("perturbed_incomplete.csv"),
                                         TEST_INPUT_FILE("prices.csv"), TEST_INPUT_FILE("callcosts.csv")),
                      QuantLib::Error);
    BOOST_CHECK_THROW(ValuationCsvLoader(TEST_INPUT_FILE("fairvalue.csv"), TEST_INPUT_FILE("perturbed.csv"),
                                         TEST_INPUT_FILE("prices.csv"), TEST_INPUT_FILE("callcosts_duplicate.csv")),
                      QuantLib::Error);
    BOOST_CHECK_THROW(ValuationCsvLoader(TEST_INPUT_FILE("missing.csv"), TEST_INPUT_FILE("perturbed.csv"),
                                         TEST_INPUT_FILE("prices.csv"), TEST_INPUT_FILE("callcosts.csv")),
                      QuantLib::Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
