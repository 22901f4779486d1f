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

#include <hrea/engine/perturbationkey.hpp>
#include <hrea/engine/samplestatistics.hpp>
#include <hrea/engine/sensitivityaggregator.hpp>

#include <hred/utilities/log.hpp>
#include <hred/utilities/to_string.hpp>

#include <ql/errors.hpp>
#include <ql/math/comparison.hpp>

#include <algorithm>

using namespace QuantLib;
using std::string;
using std::vector;

namespace hre {
namespace analytics {

namespace {

class FairValueStatistics : public boost::static_visitor<SampleStatistics> {
public:
    explicit FairValueStatistics(Size pathCount) : pathCount_(pathCount) {}

    SampleStatistics operator()(const Real value) const { return {value, 0.0, 0.0}; }

    SampleStatistics operator()(const Array& samples) const {
        QL_REQUIRE(samples.size() == pathCount_,
                   "fair value has " << samples.size() << " samples, expected " << pathCount_);
        return sampleStatistics(samples, pathCount_);
    }

private:
    Size pathCount_;
};

} // namespace

std::ostream& operator<<(std::ostream& out, const SensitivityPeriod& p) {
    out << p.key << ": units " << p.hedgeUnitsMean << " +/- " << p.hedgeUnitsStdErr << ", price " << p.priceMean
        << " +/- " << p.priceStdDev << ", cash " << p.cashInMean << " +/- " << p.cashInStdErr;
    if (p.numericFault)
        out << " (numeric fault)";
    return out;
}

bool HedgeSensitivities::hasNumericFault() const {
    return std::any_of(periods.begin(), periods.end(), [](const SensitivityPeriod& p) { return p.numericFault; });
}

SensitivityAggregator::SensitivityAggregator(const Real perturbationFactor, const Size pathCount,
                                             const Date& observationDate)
    : perturbationFactor_(perturbationFactor), pathCount_(pathCount), observationDate_(observationDate) {
    QL_REQUIRE(pathCount_ > 0, "SensitivityAggregator: path count must be positive");
    QL_REQUIRE(observationDate_ != Date(), "SensitivityAggregator: observation date is not set");
    if (close_enough(perturbationFactor_, 0.0)) {
        WLOG("SensitivityAggregator: perturbation factor is zero, hedge ratios will not be finite");
    }
}

Array SensitivityAggregator::price(const PriceLookup& priceLookup, const string& commodity, const Date& date) const {
    boost::optional<Array> p = priceLookup(commodity, date);
    QL_REQUIRE(p, "simulated price of " << commodity << " for date " << hre::data::to_string(date)
                                        << " is unavailable");
    QL_REQUIRE(p->size() == pathCount_, "simulated price of " << commodity << " for date "
                                                              << hre::data::to_string(date) << " has " << p->size()
                                                              << " samples, expected " << pathCount_);
    return *p;
}

SensitivityAggregator::Bucket SensitivityAggregator::bucket(const ValuationResult& result, const string& key,
                                                            const Array& price) const {
    auto up = result.perturbedValues.find(key);
    auto down = result.perturbedValues.find(negatedKey(key));
    QL_REQUIRE(up != result.perturbedValues.end(), "no perturbed values for key " << key);
    QL_REQUIRE(down != result.perturbedValues.end(), "no downward perturbed values for key " << key);
    QL_REQUIRE(up->second.size() == pathCount_,
               "perturbed values for key " << key << " have " << up->second.size() << " samples, expected "
                                           << pathCount_);
    QL_REQUIRE(down->second.size() == pathCount_,
               "downward perturbed values for key " << key << " have " << down->second.size()
                                                    << " samples, expected " << pathCount_);

    // central difference against the absolute price shift on each path
    Array dy = up->second - down->second;
    Array dx = (2.0 * perturbationFactor_) * price;

    Bucket b;
    b.price = price;
    b.hedgeUnits = -(dy / dx);
    b.cashIn = -(b.hedgeUnits * price);
    return b;
}

HedgeSensitivities SensitivityAggregator::aggregate(const ValuationResult& result,
                                                    const PriceLookup& priceLookup) const {
    HedgeSensitivities res;
    SampleStatistics fv = boost::apply_visitor(FairValueStatistics(pathCount_), result.fairValue);
    res.fairValueMean = fv.mean;
    res.fairValueStdErr = fv.stdErr;

    vector<PerturbationKey> keys;
    for (auto const& v : result.perturbedValues) {
        if (isNegatedKey(v.first))
            continue;
        boost::optional<PerturbationKey> key = parsePerturbationKey(v.first);
        if (!key) {
            WLOG("SensitivityAggregator: skipping perturbation key " << v.first << ", unexpected format");
            continue;
        }
        keys.push_back(*key);
    }
    std::stable_sort(keys.begin(), keys.end());
    DLOG("SensitivityAggregator: " << keys.size() << " perturbation keys");

    Array totalUnits(pathCount_, 0.0), totalCash(pathCount_, 0.0);
    for (auto const& key : keys) {
        Date priceDate = key.isSpot() ? observationDate_ : key.date;
        Bucket b = bucket(result, key.name, price(priceLookup, key.commodity, priceDate));

        SampleStatistics units = sampleStatistics(b.hedgeUnits, pathCount_);
        SampleStatistics prices = sampleStatistics(b.price, pathCount_);
        SampleStatistics cash = sampleStatistics(b.cashIn, pathCount_);

        SensitivityPeriod p;
        p.key = key.name;
        p.commodity = key.commodity;
        p.date = key.date;
        p.hedgeUnitsMean = units.mean;
        p.hedgeUnitsStdErr = units.stdErr;
        p.priceMean = prices.mean;
        p.priceStdDev = prices.stdDev;
        p.cashInMean = cash.mean;
        p.cashInStdErr = cash.stdErr;
        p.numericFault = !allFinite(b.hedgeUnits) || !allFinite(b.cashIn);

        if (key.isSpot()) {
            p.cumulativePositionMean = units.mean;
            p.cumulativePositionStdErr = units.stdErr;
            p.cumulativeCashMean = cash.mean;
            p.cumulativeCashStdErr = cash.stdErr;
            p.totalUnitsStdErr = units.stdErr;
        } else {
            totalUnits += b.hedgeUnits;
            totalCash += b.cashIn;
            SampleStatistics position = sampleStatistics(totalUnits, pathCount_);
            SampleStatistics cumulativeCash = sampleStatistics(totalCash, pathCount_);
            p.cumulativePositionMean = position.mean;
            p.cumulativePositionStdErr = position.stdErr;
            p.cumulativeCashMean = cumulativeCash.mean;
            p.cumulativeCashStdErr = cumulativeCash.stdErr;
            p.totalUnitsStdErr = position.stdErr;
            p.numericFault = p.numericFault || !allFinite(totalUnits) || !allFinite(totalCash);
        }

        if (p.numericFault) {
            WLOG("SensitivityAggregator: non finite hedge quantities for key " << key);
        }
        TLOG("SensitivityAggregator: " << p);
        res.periods.push_back(p);
    }
    return res;
}

SensitivityAggregator::PriceLookup SensitivityAggregator::priceLookup(const SimulatedPriceStore& store,
                                                                      const string& simulationId) {
    return [&store, simulationId](const string& commodity, const Date& date) -> boost::optional<Array> {
        string id = makeSimulatedPriceId(simulationId, commodity, date, date);
        if (!store.has(id))
            return boost::none;
        return store.get(id).value;
    };
}

} // namespace analytics
} // namespace hre
