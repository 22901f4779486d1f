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

#include <hrea/engine/perturbationkey.hpp>

#include <hred/utilities/parsers.hpp>

#include <ql/errors.hpp>

#include <boost/algorithm/string.hpp>

#include <vector>

using hre::data::parseInteger;

namespace hre {
namespace analytics {

bool operator<(const PerturbationKey& lhs, const PerturbationKey& rhs) {
    if (lhs.date != rhs.date)
        return lhs.date < rhs.date;
    return lhs.name < rhs.name;
}

std::ostream& operator<<(std::ostream& out, const PerturbationKey& key) {
    out << key.name;
    if (key.isSpot())
        out << " (spot)";
    else
        out << " (" << key.date << ")";
    return out;
}

bool isNegatedKey(const std::string& key) { return boost::starts_with(key, "-"); }

std::string negatedKey(const std::string& key) { return "-" + key; }

boost::optional<PerturbationKey> parsePerturbationKey(const std::string& key) {
    QL_REQUIRE(!key.empty(), "empty perturbation key");
    QL_REQUIRE(!isNegatedKey(key), "perturbation key '" << key << "' is a negated key");

    std::vector<std::string> tokens;
    boost::split(tokens, key, boost::is_any_of("-|"));

    PerturbationKey result;
    result.name = key;
    result.commodity = tokens.front();
    QL_REQUIRE(!result.commodity.empty(), "no commodity in perturbation key '" << key << "'");

    if (tokens.size() == 1)
        return result;

    if (tokens.size() != 3 && tokens.size() != 4)
        return boost::none;

    QuantLib::Integer year = parseInteger(tokens[1]);
    QuantLib::Integer month = parseInteger(tokens[2]);
    QuantLib::Integer day = tokens.size() == 4 ? parseInteger(tokens[3]) : 1;
    QL_REQUIRE(month >= 1 && month <= 12, "invalid month " << month << " in perturbation key '" << key << "'");
    result.date = QuantLib::Date(day, static_cast<QuantLib::Month>(month), year);
    return result;
}

} // namespace analytics
} // namespace hre
