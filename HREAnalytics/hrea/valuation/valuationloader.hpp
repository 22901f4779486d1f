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

/*! \file hrea/valuation/valuationloader.hpp
    \brief Loader for precomputed valuation results from csv files
    \ingroup valuation
*/

#pragma once

#include <hrea/valuation/valuationresult.hpp>

#include <map>
#include <string>
#include <vector>

namespace hre {
namespace analytics {

//! Loads a valuation result, the simulated prices and the call costs from csv files
/*! File layouts (header line required, paths are zero based and must be complete):
    - fair value: \c Path,Value for per path samples or a single \c Value column for a scalar
    - perturbed values: \c Key,Path,Value, the downward perturbation of key \c k has key \c -k
    - simulated prices: \c Commodity,Date,Path,Value
    - call costs: \c Node,Cost
    \ingroup valuation
 */
class ValuationCsvLoader {
public:
    ValuationCsvLoader(const std::string& fairValueFile, const std::string& perturbedValuesFile,
                       const std::string& simulatedPricesFile, const std::string& callCostsFile);

    const ValuationResult& result() const { return result_; }
    const std::vector<SimulatedPrice>& simulatedPrices() const { return prices_; }
    const std::map<std::string, QuantLib::Size>& callCosts() const { return callCosts_; }

private:
    void loadFairValue(const std::string& fileName);
    void loadPerturbedValues(const std::string& fileName);
    void loadSimulatedPrices(const std::string& fileName);
    void loadCallCosts(const std::string& fileName);

    ValuationResult result_;
    std::vector<SimulatedPrice> prices_;
    std::map<std::string, QuantLib::Size> callCosts_;
};

} // namespace analytics
} // namespace hre
