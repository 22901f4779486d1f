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

/*! \file hrea/app/reportwriter.hpp
  \brief A Class to write hedge analysis outputs to reports
  \ingroup app
 */

#pragma once

#include <hrea/engine/sensitivityaggregator.hpp>

#include <hred/report/report.hpp>

#include <ostream>
#include <string>

namespace hre {
namespace analytics {

//! Granularity of the hedge periods, determines how period dates are rendered
enum class Periodisation { Daily, Monthly };

//! Convert text to Periodisation, accepts \c daily and \c monthly in any case
Periodisation parsePeriodisation(const std::string& s);

std::ostream& operator<<(std::ostream& out, const Periodisation& p);

//! \c %Y-%m for monthly, \c %Y-%m-%d for daily periods, empty for the null date
std::string formatPeriodDate(const QuantLib::Date& date, const Periodisation periodisation);

//! Write hedge analysis outputs to reports
/*! \ingroup app
 */
class ReportWriter {
public:
    /*! Constructor.
        \param nullString used to represent string values that are not applicable.
    */
    ReportWriter(const std::string& nullString = "") : nullString_(nullString) {}

    virtual ~ReportWriter() {}

    /*! One row per hedge period. Besides the period statistics the report holds the price band
        (mean +/- 2 standard deviations) and the cumulative position and cash bands (mean +/- 3 standard errors).
    */
    virtual void writeHedgeReport(hre::data::Report& report, const HedgeSensitivities& sensitivities,
                                  const Periodisation periodisation, QuantLib::Size precision = 4);

    //! Text summary: per period price, hedge, cash in and position, then net cash in, net position and fair value
    virtual void writeSummary(std::ostream& out, const HedgeSensitivities& sensitivities);

    const std::string& nullString() const { return nullString_; }

protected:
    std::string nullString_;
};

} // namespace analytics
} // namespace hre
