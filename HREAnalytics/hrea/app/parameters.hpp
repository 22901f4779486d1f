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

/*! \file hrea/app/parameters.hpp
    \brief Hedge analysis setup
    \ingroup app
*/

#pragma once

#include <hrea/app/reportwriter.hpp>

#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <boost/property_tree/ptree_fwd.hpp>

#include <map>
#include <string>

namespace hre {
namespace analytics {
using std::map;
using std::string;

//! Provides the input data and references to input files used in the hedge analysis
/*! The parameter file has a root node \c HRE whose children are the parameter groups (\c Setup,
    \c Valuation, \c Telemetry, \c Replay). Each group holds \c Parameter nodes with a \c name attribute.
    Group names are stored in lower case.
    \ingroup app
 */
class Parameters {
public:
    Parameters() {}

    void clear();
    void fromFile(const string& fileName);
    void fromXMLString(const string& xml);

    bool hasGroup(const string& groupName) const;
    bool has(const string& groupName, const string& paramName) const;
    string get(const string& groupName, const string& paramName, bool fail = true) const;
    const map<string, string>& data(const string& groupName) const;

    void log();

private:
    void fromPropertyTree(const boost::property_tree::ptree& tree);

    map<string, map<string, string>> data_;
};

//! Typed view on the parameters of a hedge analysis run
/*! \ingroup app
 */
struct HedgeAnalysisParameters {
    HedgeAnalysisParameters();
    //! reads and validates the parameters, throws on missing mandatory or malformed values
    explicit HedgeAnalysisParameters(const Parameters& params);

    // setup
    string inputPath;
    string outputPath;
    string logFile;
    unsigned logMask;

    // valuation
    string title;
    string sourceFile;
    QuantLib::Date observationDate;
    //! in percent, passed to the valuation service as given
    QuantLib::Real interestRate;
    QuantLib::Size pathCount;
    QuantLib::Real perturbationFactor;
    Periodisation periodisation;
    string priceProcess;
    map<string, string> calibration;

    // telemetry
    QuantLib::Real windowFraction;
    QuantLib::Real fallbackRate;
    //! milliseconds
    QuantLib::Size pollTimeout;
    //! milliseconds, zero means no limit
    QuantLib::Size totalBudget;
    bool progressBar;

    // replay
    string fairValueFile;
    string perturbedValuesFile;
    string pricesFile;
    string callCostsFile;
    //! microseconds
    QuantLib::Size unitDelay;
    QuantLib::Size threads;
};

} // namespace analytics
} // namespace hre
