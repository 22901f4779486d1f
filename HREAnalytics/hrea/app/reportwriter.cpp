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

#include <hrea/app/reportwriter.hpp>

#include <hred/utilities/log.hpp>

#include <ql/errors.hpp>

#include <boost/algorithm/string/case_conv.hpp>

#include <iomanip>
#include <sstream>

using namespace QuantLib;
using hre::data::Report;
using std::string;

namespace hre {
namespace analytics {

Periodisation parsePeriodisation(const string& s) {
    string l = boost::algorithm::to_lower_copy(s);
    if (l == "daily")
        return Periodisation::Daily;
    else if (l == "monthly")
        return Periodisation::Monthly;
    QL_FAIL("Periodisation \"" << s << "\" not recognized");
}

std::ostream& operator<<(std::ostream& out, const Periodisation& p) {
    switch (p) {
    case Periodisation::Daily:
        return out << "daily";
    case Periodisation::Monthly:
        return out << "monthly";
    default:
        QL_FAIL("Unknown periodisation");
    }
}

string formatPeriodDate(const Date& date, const Periodisation periodisation) {
    if (date == Date())
        return string();
    std::ostringstream out;
    out << date.year() << '-' << std::setw(2) << std::setfill('0') << static_cast<Integer>(date.month());
    if (periodisation == Periodisation::Daily)
        out << '-' << std::setw(2) << std::setfill('0') << date.dayOfMonth();
    return out.str();
}

void ReportWriter::writeHedgeReport(Report& report, const HedgeSensitivities& sensitivities,
                                    const Periodisation periodisation, Size precision) {
    LOG("Writing hedge report");

    report.addColumn("Key", string())
        .addColumn("Commodity", string())
        .addColumn("Date", string())
        .addColumn("PriceMean", double(), precision)
        .addColumn("PriceStdDev", double(), precision)
        .addColumn("PriceLow", double(), precision)
        .addColumn("PriceHigh", double(), precision)
        .addColumn("HedgeUnits", double(), precision)
        .addColumn("HedgeUnitsStdErr", double(), precision)
        .addColumn("CashIn", double(), precision)
        .addColumn("CashInStdErr", double(), precision)
        .addColumn("CumulativePosition", double(), precision)
        .addColumn("CumulativePositionStdErr", double(), precision)
        .addColumn("CumulativePositionLow", double(), precision)
        .addColumn("CumulativePositionHigh", double(), precision)
        .addColumn("CumulativeCash", double(), precision)
        .addColumn("CumulativeCashStdErr", double(), precision)
        .addColumn("CumulativeCashLow", double(), precision)
        .addColumn("CumulativeCashHigh", double(), precision)
        .addColumn("NumericFault", string());

    for (auto const& p : sensitivities.periods) {
        string date = p.isSpot() ? nullString_ : formatPeriodDate(p.date, periodisation);
        report.next()
            .add(p.key)
            .add(p.commodity)
            .add(date)
            .add(p.priceMean)
            .add(p.priceStdDev)
            .add(p.priceMean - 2.0 * p.priceStdDev)
            .add(p.priceMean + 2.0 * p.priceStdDev)
            .add(p.hedgeUnitsMean)
            .add(p.hedgeUnitsStdErr)
            .add(p.cashInMean)
            .add(p.cashInStdErr)
            .add(p.cumulativePositionMean)
            .add(p.cumulativePositionStdErr)
            .add(p.cumulativePositionMean - 3.0 * p.cumulativePositionStdErr)
            .add(p.cumulativePositionMean + 3.0 * p.cumulativePositionStdErr)
            .add(p.cumulativeCashMean)
            .add(p.cumulativeCashStdErr)
            .add(p.cumulativeCashMean - 3.0 * p.cumulativeCashStdErr)
            .add(p.cumulativeCashMean + 3.0 * p.cumulativeCashStdErr)
            .add(string(p.numericFault ? "Y" : "N"));
    }
    report.end();
    LOG("Hedge report written, " << sensitivities.periods.size() << " periods");
}

void ReportWriter::writeSummary(std::ostream& out, const HedgeSensitivities& sensitivities) {
    std::ios_base::fmtflags flags = out.flags();
    std::streamsize prec = out.precision();
    out << std::fixed << std::setprecision(2);
    out << std::endl;
    if (!sensitivities.periods.empty()) {
        for (auto const& p : sensitivities.periods) {
            out << p.key << std::endl;
            out << "Price: " << p.priceMean << std::endl;
            out << "Hedge: " << p.hedgeUnitsMean << " +/- " << 3.0 * p.hedgeUnitsStdErr << " units of " << p.commodity
                << std::endl;
            out << "Cash in: " << p.cashInMean << " +/- " << 3.0 * p.cashInStdErr << std::endl;
            out << "Cum posn: " << p.cumulativePositionMean << " +/- " << 3.0 * p.cumulativePositionStdErr
                << std::endl;
            out << std::endl;
        }
        const SensitivityPeriod& last = sensitivities.periods.back();
        out << "Net cash in: " << last.cumulativeCashMean << " +/- " << 3.0 * last.cumulativeCashStdErr << std::endl;
        out << "Net position: " << last.cumulativePositionMean << " +/- " << 3.0 * last.cumulativePositionStdErr
            << std::endl;
        out << std::endl;
    }
    out << "Fair value: " << sensitivities.fairValueMean << " +/- " << 3.0 * sensitivities.fairValueStdErr
        << std::endl;
    out.flags(flags);
    out.precision(prec);
}

} // namespace analytics
} // namespace hre
