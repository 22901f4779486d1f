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

#include <hred/utilities/parsers.hpp>

#include <ql/errors.hpp>
#include <ql/utilities/null.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <cctype>

using boost::algorithm::to_upper_copy;
using QuantLib::Date;
using QuantLib::Integer;
using QuantLib::Month;
using QuantLib::Real;
using QuantLib::Year;
using std::string;
using std::vector;

namespace hre {
namespace data {

Date parseDate(const string& s) {
    QL_REQUIRE(!s.empty(), "Cannot convert empty string to date");

    if (s.size() == 8 && std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit(c); })) {
        // yyyymmdd
        Year y = boost::lexical_cast<Year>(s.substr(0, 4));
        Month m = static_cast<Month>(boost::lexical_cast<Integer>(s.substr(4, 2)));
        QuantLib::Day d = boost::lexical_cast<QuantLib::Day>(s.substr(6, 2));
        return Date(d, m, y);
    }

    if (s.size() == 10 && (s[4] == '-' || s[4] == '/' || s[4] == '.') && s[7] == s[4]) {
        // yyyy-mm-dd, yyyy/mm/dd, yyyy.mm.dd
        try {
            Year y = boost::lexical_cast<Year>(s.substr(0, 4));
            Month m = static_cast<Month>(boost::lexical_cast<Integer>(s.substr(5, 2)));
            QuantLib::Day d = boost::lexical_cast<QuantLib::Day>(s.substr(8, 2));
            return Date(d, m, y);
        } catch (const boost::bad_lexical_cast&) {
            QL_FAIL("Cannot convert \"" << s << "\" to Date.");
        }
    }

    QL_FAIL("Cannot convert \"" << s << "\" to Date.");
}

Real parseReal(const string& s) {
    try {
        return std::stod(s);
    } catch (const std::exception& ex) {
        QL_FAIL("Failed to parseReal(\"" << s << "\") " << ex.what());
    }
}

bool tryParseReal(const string& s, QuantLib::Real& result) {
    try {
        result = std::stod(s);
    } catch (const std::exception&) {
        result = QuantLib::Null<Real>();
        return false;
    }
    return true;
}

Integer parseInteger(const string& s) {
    try {
        return boost::lexical_cast<Integer>(s.c_str());
    } catch (std::exception& ex) {
        QL_FAIL("Failed to parseInteger(\"" << s << "\") " << ex.what());
    }
}

bool parseBool(const string& s) {
    static const vector<string> trueStrings = {"Y", "YES", "TRUE", "1"};
    static const vector<string> falseStrings = {"N", "NO", "FALSE", "0"};
    string upper = to_upper_copy(boost::algorithm::trim_copy(s));
    if (std::find(trueStrings.begin(), trueStrings.end(), upper) != trueStrings.end())
        return true;
    if (std::find(falseStrings.begin(), falseStrings.end(), upper) != falseStrings.end())
        return false;
    QL_FAIL("Cannot convert \"" << s << "\" to bool");
}

vector<string> parseListOfValues(string s) {
    boost::trim(s);
    vector<string> vec;
    if (s.empty())
        return vec;
    boost::split(vec, s, boost::is_any_of(","));
    for (auto& v : vec)
        boost::trim(v);
    return vec;
}

} // namespace data
} // namespace hre
