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

#include <hrea/valuation/valuationresult.hpp>

#include <hred/utilities/to_string.hpp>

using hre::data::to_string;

namespace hre {
namespace analytics {

std::string makeResultId(const std::string& valuationId, const std::string& specId) {
    return valuationId + "#" + specId;
}

std::string makeSimulatedPriceId(const std::string& simulationId, const std::string& commodity,
                                 const QuantLib::Date& startDate, const QuantLib::Date& endDate) {
    return simulationId + "#" + commodity + "#" + to_string(startDate) + "#" + to_string(endDate);
}

} // namespace analytics
} // namespace hre
