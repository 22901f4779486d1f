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

/*! \file hrea/valuation/valuationresult.hpp
    \brief Results of a contract valuation and simulated prices
    \ingroup valuation
*/

#pragma once

#include <ql/math/array.hpp>
#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <boost/variant.hpp>

#include <map>
#include <string>

namespace hre {
namespace analytics {

//! Base fair value of a valuation, either a scalar or one sample per simulated path
typedef boost::variant<QuantLib::Real, QuantLib::Array> FairValue;

//! Result of a contract valuation
/*! The perturbed values are keyed by perturbation key, the downward perturbation of a key \c k is stored
    under \c -k. All sample vectors have one entry per simulated path.
    \ingroup valuation
 */
struct ValuationResult {
    ValuationResult() : fairValue(QuantLib::Real(0.0)) {}
    ValuationResult(const FairValue& fairValue, const std::map<std::string, QuantLib::Array>& perturbedValues)
        : fairValue(fairValue), perturbedValues(perturbedValues) {}

    FairValue fairValue;
    std::map<std::string, QuantLib::Array> perturbedValues;

    //! true if the fair value holds per path samples
    bool hasFairValueSamples() const { return fairValue.which() == 1; }
};

//! Simulated price of a commodity for one date, one sample per path
/*! \ingroup valuation
 */
struct SimulatedPrice {
    std::string id;
    std::string commodity;
    QuantLib::Date date;
    QuantLib::Array value;
};

//! Id of the result of the valuation \p valuationId of the contract specification \p specId
std::string makeResultId(const std::string& valuationId, const std::string& specId);

//! Id of the simulated price of \p commodity in the simulation \p simulationId for the given date range
std::string makeSimulatedPriceId(const std::string& simulationId, const std::string& commodity,
                                 const QuantLib::Date& startDate, const QuantLib::Date& endDate);

} // namespace analytics
} // namespace hre
