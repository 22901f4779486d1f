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

#include <hred/report/csvreport.hpp>
#include <hred/report/inmemoryreport.hpp>
#include <hred/utilities/log.hpp>

#include <boost/algorithm/string/join.hpp>

namespace hre {
namespace data {

Report& InMemoryReport::addColumn(const string& name, const ReportType& rt, Size precision) {
    QL_REQUIRE(!hasHeader(name), "InMemoryReport: duplicate column '" << name << "'");
    headers_.push_back(name);
    columnTypes_.push_back(rt);
    columnPrecision_.push_back(precision);
    data_.push_back(vector<ReportType>()); // Initialise vector for column
    i_++;
    return *this;
}

Report& InMemoryReport::next() {
    QL_REQUIRE(i_ == headers_.size(), "Cannot go to next line, only " << i_ << " entries filled, report headers are: "
                                                                      << boost::algorithm::join(headers_, ","));
    i_ = 0;
    return *this;
}

Report& InMemoryReport::add(const ReportType& rt) {
    QL_REQUIRE(i_ < headers_.size(),
               "No column to add [" << rt << "] to. Report headers are: " << boost::algorithm::join(headers_, ","));
    QL_REQUIRE(rt.which() == columnTypes_[i_].which(),
               "Cannot add value " << rt << " of type " << rt.which() << " to column " << headers_[i_] << " of type "
                                   << columnTypes_[i_].which() << ". Report headers are: "
                                   << boost::algorithm::join(headers_, ","));
    data_[i_].push_back(rt);
    i_++;
    return *this;
}

void InMemoryReport::end() {
    QL_REQUIRE(i_ == headers_.size() || i_ == 0, "report is finalized with incomplete row, got data for "
                                                      << i_ << " columns out of " << headers_.size());
}

const vector<Report::ReportType>& InMemoryReport::data(Size i) const {
    QL_REQUIRE(i < data_.size(), "InMemoryReport: column index " << i << " out of range, have " << data_.size());
    return data_[i];
}

const vector<Report::ReportType>& InMemoryReport::data(const string& header) const {
    auto it = std::find(headers_.begin(), headers_.end(), header);
    QL_REQUIRE(it != headers_.end(), "InMemoryReport: column '" << header << "' not found");
    return data_[std::distance(headers_.begin(), it)];
}

void InMemoryReport::toFile(const string& filename, const char sep, const bool commentCharacter, char quoteChar,
                            const string& nullString, bool lowerHeader) {
    LOG("Writing InMemoryReport to file '" << filename << "'");
    CSVFileReport cReport(filename, sep, commentCharacter, quoteChar, nullString, lowerHeader);

    for (Size i = 0; i < headers_.size(); i++)
        cReport.addColumn(headers_[i], columnTypes_[i], columnPrecision_[i]);

    for (Size j = 0; j < rows(); j++) {
        cReport.next();
        for (Size i = 0; i < headers_.size(); i++)
            cReport.add(data_[i][j]);
    }
    cReport.end();
}

} // namespace data
} // namespace hre
