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

/*! \file hred/utilities/parsers.hpp
    \brief String conversion utilities
    \ingroup utilities
*/

#pragma once

#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <string>
#include <vector>

namespace hre {
namespace data {

//! Convert text to QuantLib::Date
/*!
  Accepts the formats yyyy-mm-dd, yyyy/mm/dd, yyyy.mm.dd and yyyymmdd.
  \ingroup utilities
 */
QuantLib::Date parseDate(const std::string& s);

//! Convert text to Real
/*!
  \ingroup utilities
 */
QuantLib::Real parseReal(const std::string& s);

//! Attempt to convert text to Real
/*! Attempts to convert text to Real
    \param[in]  s      The string we wish to convert to a Real
    \param[out] result The result of the conversion if it is valid.
                       Null<Real>() if conversion fails

    \return True if the conversion was successful, False if not

    \ingroup utilities
 */
bool tryParseReal(const std::string& s, QuantLib::Real& result);

//! Convert text to QuantLib::Integer
/*!
  \ingroup utilities
 */
QuantLib::Integer parseInteger(const std::string& s);

//! Convert text to bool
/*!
  Accepts Y, YES, TRUE, true, 1 and N, NO, FALSE, false, 0.
  \ingroup utilities
 */
bool parseBool(const std::string& s);

//! Convert comma separated list to vector of strings, the elements are trimmed
/*!
  \ingroup utilities
 */
std::vector<std::string> parseListOfValues(std::string s);

} // namespace data
} // namespace hre
