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
#include <hrea/engine/sensitivityaggregator.hpp>
#include <hret/toplevelfixture.hpp>

#include <cmath>
#include <map>
#include <utility>
#include <vector>

using namespace hre::analytics;
using QuantLib::Array;
using QuantLib::Date;
using QuantLib::Real;
using QuantLib::Size;
using std::string;

namespace {

const Date today(15, QuantLib::December, 2019);

Array samples(const std::vector<Real>& v) { return Array(v.begin(), v.end()); }

Real meanOf(const Array& a) {
    Real sum = 0.0;
    for (auto const& x : a)
        sum += x;
    return sum / a.size();
}

Real stdDevOf(const Array& a) {
    Real m = meanOf(a), sum = 0.0;
    for (auto const& x : a)
        sum += (x - m) * (x - m);
    return std::sqrt(sum / a.size());
}

// simulated prices by commodity and date
class PriceTable {
public:
    void add(const string& commodity, const Date& date, const Array& price) {
        prices_[std::make_pair(commodity, date)] = price;
    }
    SensitivityAggregator::PriceLookup lookup() const {
        return [this](const string& commodity, const Date& date) -> boost::optional<Array> {
            auto it = prices_.find(std::make_pair(commodity, date));
            if (it == prices_.end())
                return boost::none;
            return it->second;
        };
    }

private:
    std::map<std::pair<string, Date>, Array> prices_;
};

// pathwise hedge units for the given values and price
Array hedgeUnits(const Array& up, const Array& down, const Array& price, Real eps) {
    Array h(price.size());
    for (Size i = 0; i < price.size(); ++i)
        h[i] = -((up[i] - down[i]) / (2.0 * eps * price[i]));
    return h;
}

Array cashIn(const Array& h, const Array& price) {
    Array c(price.size());
    for (Size i = 0; i < price.size(); ++i)
        c[i] = -h[i] * price[i];
    return c;
}

bool mentionsDate(const QuantLib::Error& e) { return boost::contains(e.what(), "2020-02-01"); }

} // namespace

BOOST_FIXTURE_TEST_SUITE(HREAnalyticsTestSuite, hre::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(SensitivityAggregatorTest)

BOOST_AUTO_TEST_CASE(testPathwiseHedgeUnits) {

    BOOST_TEST_MESSAGE("Testing pathwise hedge units and their standard errors...");

    Real eps = 0.01;
    Array up = samples({110.0, 104.0, 100.0, 96.0});
    Array down = samples({90.0, 96.0, 100.0, 104.0});
    Array price = samples({50.0, 40.0, 25.0, 20.0});

    PriceTable prices;
    prices.add("OIL", Date(1, QuantLib::January, 2020), price);
    ValuationResult result(Real(0.0), {{"OIL-2020-1", up}, {"-OIL-2020-1", down}});

    HedgeSensitivities res = SensitivityAggregator(eps, 4, today).aggregate(result, prices.lookup());
    BOOST_REQUIRE_EQUAL(res.periods.size(), 1);
    const SensitivityPeriod& p = res.periods.front();

    Array h = hedgeUnits(up, down, price, eps);
    Array c = cashIn(h, price);
    BOOST_CHECK_EQUAL(p.key, "OIL-2020-1");
    BOOST_CHECK_EQUAL(p.commodity, "OIL");
    BOOST_CHECK_EQUAL(p.date, Date(1, QuantLib::January, 2020));
    BOOST_CHECK_CLOSE(p.hedgeUnitsMean, meanOf(h), 1e-8);
    BOOST_CHECK_CLOSE(p.hedgeUnitsStdErr, stdDevOf(h) / 2.0, 1e-8);
    BOOST_CHECK_CLOSE(p.cashInMean, meanOf(c), 1e-8);
    BOOST_CHECK_CLOSE(p.cashInStdErr, stdDevOf(c) / 2.0, 1e-8);
    // price dispersion is not scaled by the path count
    BOOST_CHECK_CLOSE(p.priceMean, 33.75, 1e-8);
    BOOST_CHECK_CLOSE(p.priceStdDev, stdDevOf(price), 1e-8);
    BOOST_CHECK(!p.numericFault);
    BOOST_CHECK(!res.hasNumericFault());
}

BOOST_AUTO_TEST_CASE(testSingleDatedBucket) {

    BOOST_TEST_MESSAGE("Testing the hedge of a single dated bucket...");

    Size paths = 1000;
    Array up(paths), down(paths);
    for (Size i = 0; i < paths; ++i) {
        Real noise = std::sin(static_cast<Real>(i));
        up[i] = 105.0 + noise;
        down[i] = 95.0 + noise;
    }
    PriceTable prices;
    prices.add("OIL", Date(1, QuantLib::January, 2020), Array(paths, 50.0));
    ValuationResult result(Real(100.0), {{"OIL-2020-1", up}, {"-OIL-2020-1", down}});

    HedgeSensitivities res = SensitivityAggregator(0.01, paths, today).aggregate(result, prices.lookup());
    BOOST_REQUIRE_EQUAL(res.periods.size(), 1);
    const SensitivityPeriod& p = res.periods.front();
    BOOST_CHECK_CLOSE(p.hedgeUnitsMean, -10.0, 1e-8);
    BOOST_CHECK_CLOSE(p.cashInMean, 500.0, 1e-8);
    BOOST_CHECK_SMALL(p.hedgeUnitsStdErr, 1e-8);
    BOOST_CHECK_CLOSE(p.cumulativePositionMean, -10.0, 1e-8);
    BOOST_CHECK_CLOSE(p.cumulativeCashMean, 500.0, 1e-8);
    BOOST_CHECK_CLOSE(res.fairValueMean, 100.0, 1e-8);
    BOOST_CHECK_EQUAL(res.fairValueStdErr, 0.0);
}

BOOST_AUTO_TEST_CASE(testCumulativeChain) {

    BOOST_TEST_MESSAGE("Testing the pathwise accumulation over dated buckets...");

    Real eps = 0.05;
    Date jan(1, QuantLib::January, 2020), feb(1, QuantLib::February, 2020), mar(15, QuantLib::March, 2020);
    Array p1 = samples({10.0, 12.0, 8.0}), p2 = samples({11.0, 9.0, 13.0}), p3 = samples({20.0, 25.0, 15.0});
    Array u1 = samples({3.0, 1.0, 2.0}), d1 = samples({1.0, 2.0, 0.0});
    Array u2 = samples({5.0, 4.0, 2.0}), d2 = samples({1.0, 1.0, 1.0});
    Array u3 = samples({0.0, 7.0, 3.0}), d3 = samples({2.0, 1.0, 1.0});

    PriceTable prices;
    prices.add("OIL", jan, p1);
    prices.add("GAS", feb, p2);
    prices.add("OIL", mar, p3);
    // map order differs from the chronological order
    ValuationResult result(Real(0.0), {{"OIL-2020-3-15", u3},
                                       {"-OIL-2020-3-15", d3},
                                       {"OIL-2020-1", u1},
                                       {"-OIL-2020-1", d1},
                                       {"GAS|2020|2", u2},
                                       {"-GAS|2020|2", d2}});

    HedgeSensitivities res = SensitivityAggregator(eps, 3, today).aggregate(result, prices.lookup());
    BOOST_REQUIRE_EQUAL(res.periods.size(), 3);
    BOOST_CHECK_EQUAL(res.periods[0].date, jan);
    BOOST_CHECK_EQUAL(res.periods[1].date, feb);
    BOOST_CHECK_EQUAL(res.periods[2].date, mar);
    BOOST_CHECK_EQUAL(res.periods[1].commodity, "GAS");

    Array h1 = hedgeUnits(u1, d1, p1, eps), h2 = hedgeUnits(u2, d2, p2, eps), h3 = hedgeUnits(u3, d3, p3, eps);
    Array units = h1 + h2 + h3;
    Array cash = cashIn(h1, p1) + cashIn(h2, p2) + cashIn(h3, p3);

    const SensitivityPeriod& last = res.periods.back();
    Real sqrt3 = std::sqrt(3.0);
    BOOST_CHECK_CLOSE(last.cumulativePositionMean, meanOf(units), 1e-8);
    BOOST_CHECK_CLOSE(last.cumulativePositionStdErr, stdDevOf(units) / sqrt3, 1e-8);
    BOOST_CHECK_CLOSE(last.totalUnitsStdErr, stdDevOf(units) / sqrt3, 1e-8);
    BOOST_CHECK_CLOSE(last.cumulativeCashMean, meanOf(cash), 1e-8);
    BOOST_CHECK_CLOSE(last.cumulativeCashStdErr, stdDevOf(cash) / sqrt3, 1e-8);
    BOOST_CHECK_CLOSE(last.hedgeUnitsStdErr, stdDevOf(h3) / sqrt3, 1e-8);

    // the first bucket is its own chain
    BOOST_CHECK_CLOSE(res.periods[0].cumulativePositionMean, res.periods[0].hedgeUnitsMean, 1e-8);
    BOOST_CHECK_CLOSE(res.periods[0].cumulativeCashStdErr, res.periods[0].cashInStdErr, 1e-8);
}

BOOST_AUTO_TEST_CASE(testSpotBucket) {

    BOOST_TEST_MESSAGE("Testing a spot only valuation...");

    PriceTable prices;
    prices.add("GAS", today, samples({2.0, 4.0}));
    ValuationResult result(Real(1.0), {{"GAS", samples({1.2, 1.5})}, {"-GAS", samples({0.8, 1.1})}});

    HedgeSensitivities res = SensitivityAggregator(0.1, 2, today).aggregate(result, prices.lookup());
    BOOST_REQUIRE_EQUAL(res.periods.size(), 1);
    const SensitivityPeriod& p = res.periods.front();
    BOOST_CHECK(p.isSpot());
    BOOST_CHECK(p.date == Date());
    BOOST_CHECK_CLOSE(p.hedgeUnitsMean, -0.75, 1e-8);
    BOOST_CHECK_EQUAL(p.cumulativePositionMean, p.hedgeUnitsMean);
    BOOST_CHECK_EQUAL(p.cumulativePositionStdErr, p.hedgeUnitsStdErr);
    BOOST_CHECK_EQUAL(p.cumulativeCashMean, p.cashInMean);
    BOOST_CHECK_EQUAL(p.cumulativeCashStdErr, p.cashInStdErr);
    BOOST_CHECK_EQUAL(p.totalUnitsStdErr, p.hedgeUnitsStdErr);
}

BOOST_AUTO_TEST_CASE(testSpotBeforeDated) {

    BOOST_TEST_MESSAGE("Testing that the spot bucket precedes and stays out of the dated chain...");

    Date jan(1, QuantLib::January, 2020);
    PriceTable prices;
    prices.add("OIL", today, Array(2, 40.0));
    prices.add("OIL", jan, Array(2, 50.0));
    ValuationResult result(Real(0.0), {{"OIL-2020-1", Array(2, 2.0)},
                                       {"-OIL-2020-1", Array(2, 1.0)},
                                       {"OIL", Array(2, 4.0)},
                                       {"-OIL", Array(2, 2.0)}});

    HedgeSensitivities res = SensitivityAggregator(0.01, 2, today).aggregate(result, prices.lookup());
    BOOST_REQUIRE_EQUAL(res.periods.size(), 2);
    BOOST_CHECK(res.periods[0].isSpot());
    BOOST_CHECK_CLOSE(res.periods[0].priceMean, 40.0, 1e-8);
    BOOST_CHECK_CLOSE(res.periods[0].hedgeUnitsMean, -2.5, 1e-8);
    BOOST_CHECK_EQUAL(res.periods[1].date, jan);
    BOOST_CHECK_CLOSE(res.periods[1].hedgeUnitsMean, -1.0, 1e-8);
    BOOST_CHECK_CLOSE(res.periods[1].cumulativePositionMean, -1.0, 1e-8);
}

BOOST_AUTO_TEST_CASE(testMissingPrice) {

    BOOST_TEST_MESSAGE("Testing a valuation without simulated price for a bucket...");

    PriceTable prices;
    prices.add("OIL", Date(1, QuantLib::January, 2020), Array(2, 50.0));
    ValuationResult result(Real(0.0), {{"OIL-2020-1", Array(2, 2.0)},
                                       {"-OIL-2020-1", Array(2, 1.0)},
                                       {"OIL-2020-2", Array(2, 2.0)},
                                       {"-OIL-2020-2", Array(2, 1.0)}});

    SensitivityAggregator aggregator(0.01, 2, today);
    BOOST_CHECK_EXCEPTION(aggregator.aggregate(result, prices.lookup()), QuantLib::Error, mentionsDate);

    // wrong number of price samples
    prices.add("OIL", Date(1, QuantLib::February, 2020), Array(3, 50.0));
    BOOST_CHECK_THROW(aggregator.aggregate(result, prices.lookup()), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testMissingDownwardValues) {

    BOOST_TEST_MESSAGE("Testing a perturbed value without downward counterpart...");

    PriceTable prices;
    prices.add("OIL", Date(1, QuantLib::January, 2020), Array(2, 50.0));
    ValuationResult result(Real(0.0), {{"OIL-2020-1", Array(2, 2.0)}});
    BOOST_CHECK_THROW(SensitivityAggregator(0.01, 2, today).aggregate(result, prices.lookup()), QuantLib::Error);

    ValuationResult wrongSize(Real(0.0), {{"OIL-2020-1", Array(2, 2.0)}, {"-OIL-2020-1", Array(1, 1.0)}});
    BOOST_CHECK_THROW(SensitivityAggregator(0.01, 2, today).aggregate(wrongSize, prices.lookup()),
                      QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testNumericFault) {

    BOOST_TEST_MESSAGE("Testing non finite hedge quantities...");

    Date jan(1, QuantLib::January, 2020), feb(1, QuantLib::February, 2020);
    PriceTable prices;
    prices.add("OIL", jan, samples({50.0, 0.0}));
    prices.add("OIL", feb, Array(2, 50.0));
    ValuationResult result(Real(0.0), {{"OIL-2020-1", Array(2, 2.0)},
                                       {"-OIL-2020-1", Array(2, 1.0)},
                                       {"OIL-2020-2", Array(2, 2.0)},
                                       {"-OIL-2020-2", Array(2, 1.0)}});

    HedgeSensitivities res = SensitivityAggregator(0.01, 2, today).aggregate(result, prices.lookup());
    BOOST_REQUIRE_EQUAL(res.periods.size(), 2);
    BOOST_CHECK(res.periods[0].numericFault);
    BOOST_CHECK(!std::isfinite(res.periods[0].hedgeUnitsMean));
    // the fault carries over to the cumulative position
    BOOST_CHECK(res.periods[1].numericFault);
    BOOST_CHECK(std::isfinite(res.periods[1].hedgeUnitsMean));
    BOOST_CHECK(res.hasNumericFault());

    // a zero perturbation factor gives no finite hedge at all
    ValuationResult dated(Real(0.0), {{"OIL-2020-2", Array(2, 2.0)}, {"-OIL-2020-2", Array(2, 1.0)}});
    HedgeSensitivities zeroShift = SensitivityAggregator(0.0, 2, today).aggregate(dated, prices.lookup());
    BOOST_REQUIRE_EQUAL(zeroShift.periods.size(), 1);
    BOOST_CHECK(zeroShift.periods.front().numericFault);
}

BOOST_AUTO_TEST_CASE(testFairValue) {

    BOOST_TEST_MESSAGE("Testing scalar and sampled fair values...");

    PriceTable prices;
    SensitivityAggregator aggregator(0.01, 4, today);

    HedgeSensitivities scalar = aggregator.aggregate(ValuationResult(Real(12.5), {}), prices.lookup());
    BOOST_CHECK_EQUAL(scalar.fairValueMean, 12.5);
    BOOST_CHECK_EQUAL(scalar.fairValueStdErr, 0.0);
    BOOST_CHECK(scalar.periods.empty());

    Array fv = samples({1.0, 2.0, 3.0, 6.0});
    HedgeSensitivities sampled = aggregator.aggregate(ValuationResult(fv, {}), prices.lookup());
    BOOST_CHECK_CLOSE(sampled.fairValueMean, 3.0, 1e-8);
    BOOST_CHECK_CLOSE(sampled.fairValueStdErr, std::sqrt(3.5) / 2.0, 1e-8);

    BOOST_CHECK_THROW(aggregator.aggregate(ValuationResult(Array(3, 1.0), {}), prices.lookup()), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testUnexpectedKeyFormat) {

    BOOST_TEST_MESSAGE("Testing that keys of unexpected format are skipped...");

    PriceTable prices;
    prices.add("OIL", Date(1, QuantLib::January, 2020), Array(2, 50.0));
    ValuationResult result(Real(0.0), {{"OIL-2020", Array(2, 2.0)},
                                       {"-OIL-2020", Array(2, 1.0)},
                                       {"OIL-2020-1", Array(2, 2.0)},
                                       {"-OIL-2020-1", Array(2, 1.0)}});
    HedgeSensitivities res = SensitivityAggregator(0.01, 2, today).aggregate(result, prices.lookup());
    BOOST_REQUIRE_EQUAL(res.periods.size(), 1);
    BOOST_CHECK_EQUAL(res.periods.front().key, "OIL-2020-1");
}

BOOST_AUTO_TEST_CASE(testStorePriceLookup) {

    BOOST_TEST_MESSAGE("Testing the price lookup against a simulated price store...");

    Date jan(1, QuantLib::January, 2020);
    InMemorySimulatedPriceStore store;
    store.add({makeSimulatedPriceId("simulation-1", "OIL", jan, jan), "OIL", jan, Array(2, 50.0)});

    SensitivityAggregator::PriceLookup lookup = SensitivityAggregator::priceLookup(store, "simulation-1");
    boost::optional<Array> price = lookup("OIL", jan);
    BOOST_REQUIRE(price);
    BOOST_CHECK_EQUAL((*price)[1], 50.0);
    BOOST_CHECK(!lookup("GAS", jan));
    BOOST_CHECK(!SensitivityAggregator::priceLookup(store, "simulation-2")("OIL", jan));
}

BOOST_AUTO_TEST_CASE(testInvalidSetup) {

    BOOST_TEST_MESSAGE("Testing invalid aggregator setups...");

    BOOST_CHECK_THROW(SensitivityAggregator(0.01, 0, today), QuantLib::Error);
    BOOST_CHECK_THROW(SensitivityAggregator(0.01, 10, Date()), QuantLib::Error);
    BOOST_CHECK_NO_THROW(SensitivityAggregator(0.0, 10, today));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
