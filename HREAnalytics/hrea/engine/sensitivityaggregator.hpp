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

/*! \file hrea/engine/sensitivityaggregator.hpp
    \brief Hedge ratios and cash flows from perturbed valuations
    \ingroup engine
*/

#pragma once

#include <hrea/valuation/resultstore.hpp>
#include <hrea/valuation/valuationresult.hpp>

#include <ql/math/array.hpp>
#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <boost/optional.hpp>

#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace hre {
namespace analytics {

//! Hedge statistics of one perturbation bucket
/*! Means and standard errors are taken over the simulated paths. The price standard deviation is the
    dispersion of the price itself and is not scaled by the path count. The cumulative fields refer to the
    running pathwise sums over the dated buckets up to and including this one; for a spot bucket they are
    equal to the bucket's own fields.
    \ingroup engine
 */
struct SensitivityPeriod {
    std::string key;
    std::string commodity;
    //! null for the spot bucket
    QuantLib::Date date;
    QuantLib::Real hedgeUnitsMean;
    QuantLib::Real hedgeUnitsStdErr;
    QuantLib::Real priceMean;
    QuantLib::Real priceStdDev;
    QuantLib::Real cashInMean;
    QuantLib::Real cashInStdErr;
    QuantLib::Real cumulativePositionMean;
    QuantLib::Real cumulativePositionStdErr;
    QuantLib::Real cumulativeCashMean;
    QuantLib::Real cumulativeCashStdErr;
    QuantLib::Real totalUnitsStdErr;
    //! true if any of the pathwise hedge quantities is not finite (zero perturbation factor or zero price)
    bool numericFault;

    bool isSpot() const { return date == QuantLib::Date(); }
};

std::ostream& operator<<(std::ostream& out, const SensitivityPeriod& p);

//! Fair value and hedge periods of a valuation
/*! The periods hold the spot buckets first (ordered by key), followed by the dated buckets in chronological
    order.
    \ingroup engine
 */
struct HedgeSensitivities {
    QuantLib::Real fairValueMean;
    QuantLib::Real fairValueStdErr;
    std::vector<SensitivityPeriod> periods;

    bool hasNumericFault() const;
};

//! Class for aggregating perturbed valuations into hedge ratios and cash flows
/*! For each perturbation key \f$ k \f$ with upward and downward perturbed values \f$ V^+, V^- \f$ and the
    simulated price \f$ S \f$ of the perturbed commodity and date the pathwise hedge is
    \f[
        h = -\frac{V^+ - V^-}{2 \epsilon S}, \qquad c = -h S
    \f]
    where \f$ c \f$ is the cash received when the hedge is put on. The dated buckets are processed in
    chronological order and \f$ h \f$ and \f$ c \f$ are accumulated pathwise, so the standard errors of the
    cumulative position and cash reflect the correlation between the buckets.

    Non finite hedge quantities are not clamped, the affected periods are flagged instead.
    \ingroup engine
 */
class SensitivityAggregator {
public:
    //! simulated price samples of a commodity for a date, none if there is no simulated price
    typedef std::function<boost::optional<QuantLib::Array>(const std::string&, const QuantLib::Date&)> PriceLookup;

    /*! \param perturbationFactor relative price shift \f$ \epsilon \f$ of the perturbed valuations
        \param pathCount          number of simulated paths
        \param observationDate    date of the spot prices
    */
    SensitivityAggregator(const QuantLib::Real perturbationFactor, const QuantLib::Size pathCount,
                          const QuantLib::Date& observationDate);

    //! throws if a simulated price is missing or a perturbed value has no downward counterpart
    HedgeSensitivities aggregate(const ValuationResult& result, const PriceLookup& priceLookup) const;

    //! price lookup against the price store, for the prices of the given simulation
    static PriceLookup priceLookup(const SimulatedPriceStore& store, const std::string& simulationId);

private:
    struct Bucket {
        QuantLib::Array price;
        QuantLib::Array hedgeUnits;
        QuantLib::Array cashIn;
    };

    Bucket bucket(const ValuationResult& result, const std::string& key, const QuantLib::Array& price) const;
    QuantLib::Array price(const PriceLookup& priceLookup, const std::string& commodity,
                          const QuantLib::Date& date) const;

    QuantLib::Real perturbationFactor_;
    QuantLib::Size pathCount_;
    QuantLib::Date observationDate_;
};

} // namespace analytics
} // namespace hre
