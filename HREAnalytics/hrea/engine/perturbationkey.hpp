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

/*! \file hrea/engine/perturbationkey.hpp
    \brief Keys of perturbed valuations
    \ingroup engine
*/

#pragma once

#include <ql/time/date.hpp>

#include <boost/optional.hpp>

#include <ostream>
#include <string>

namespace hre {
namespace analytics {

//! Key of a perturbed valuation
/*! A key is either a bare commodity name (the spot price of the commodity is perturbed) or
    \c commodity-year-month[-day] (the price of the commodity for that date is perturbed). The separator
    can be \c - or \c |. The downward perturbation of a key is stored under the key prefixed with \c -.
    \ingroup engine
 */
struct PerturbationKey {
    std::string name;
    std::string commodity;
    //! null for spot keys
    QuantLib::Date date;

    bool isSpot() const { return date == QuantLib::Date(); }
};

//! orders spot keys before dated keys, dated keys by date, ties by name
bool operator<(const PerturbationKey& lhs, const PerturbationKey& rhs);

std::ostream& operator<<(std::ostream& out, const PerturbationKey& key);

//! true if the key denotes a downward perturbation
bool isNegatedKey(const std::string& key);

//! the key of the downward perturbation
std::string negatedKey(const std::string& key);

/*! Parse a key, the day defaults to 1 if it is not given. Returns none if the key has neither one part (spot)
    nor three or four parts (dated), throws if the date parts are not valid.
*/
boost::optional<PerturbationKey> parsePerturbationKey(const std::string& key);

} // namespace analytics
} // namespace hre
