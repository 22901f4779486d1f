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

#include <hred/utilities/to_string.hpp>

#include <iomanip>

namespace hre {
namespace data {

std::string to_string(const QuantLib::Date& date) {
    if (date == QuantLib::Date())
        return "1900-01-01";
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << date.year() << "-" << std::setw(2) << static_cast<int>(date.month())
        << "-" << std::setw(2) << date.dayOfMonth();
    return oss.str();
}

std::string to_string(bool aBool) { return aBool ? "true" : "false"; }

} // namespace data
} // namespace hre
