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

/*! \file hrea/version.hpp
    \brief Version
*/

#ifndef hre_version_hpp
#define hre_version_hpp

// Boost Version
// Boost 1.65 is the oldest version tested, boost::circular_buffer and boost::accumulators are used as shipped
// with that release.
#include <boost/version.hpp>
#if BOOST_VERSION < 106500
#error using an old version of Boost, please update.
#endif

// We require QuantLib 1.20 or higher
#include <ql/version.hpp>
#if QL_HEX_VERSION < 0x012000f0
#error using an old version of QuantLib, please update.
#endif

//! Version string
#define HRE_VERSION "1.0.0.0"

//! Version number
#define HRE_VERSION_NUM 1000000

#endif
