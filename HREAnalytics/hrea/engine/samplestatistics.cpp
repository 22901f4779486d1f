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

#include <hrea/engine/samplestatistics.hpp>

#include <ql/errors.hpp>

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/variance.hpp>

#include <algorithm>
#include <cmath>

using namespace boost::accumulators;

namespace hre {
namespace analytics {

SampleStatistics sampleStatistics(const QuantLib::Array& samples, QuantLib::Size pathCount) {
    QL_REQUIRE(!samples.empty(), "sampleStatistics: no samples given");
    QL_REQUIRE(pathCount > 0, "sampleStatistics: path count must be positive");
    accumulator_set<double, stats<tag::mean, tag::variance>> acc;
    for (auto const& s : samples)
        acc(s);
    SampleStatistics result;
    result.mean = mean(acc);
    result.stdDev = std::sqrt(variance(acc));
    result.stdErr = result.stdDev / std::sqrt(static_cast<QuantLib::Real>(pathCount));
    return result;
}

bool allFinite(const QuantLib::Array& samples) {
    return std::all_of(samples.begin(), samples.end(), [](QuantLib::Real x) { return std::isfinite(x); });
}

} // namespace analytics
} // namespace hre
