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

/*! \file hrea/engine/samplestatistics.hpp
    \brief Statistics over the path dimension of Monte Carlo samples
    \ingroup engine
*/

#pragma once

#include <ql/math/array.hpp>
#include <ql/types.hpp>

namespace hre {
namespace analytics {

//! Mean and dispersion of a sample vector
/*! The standard deviation is the population standard deviation (divisor n), the standard error of the
    mean is the standard deviation divided by the square root of the path count.
    \ingroup engine
 */
struct SampleStatistics {
    QuantLib::Real mean;
    QuantLib::Real stdDev;
    QuantLib::Real stdErr;
};

//! statistics of the samples, \p pathCount is the number of paths used for the standard error
SampleStatistics sampleStatistics(const QuantLib::Array& samples, QuantLib::Size pathCount);

//! true if all samples are finite
bool allFinite(const QuantLib::Array& samples);

} // namespace analytics
} // namespace hre
