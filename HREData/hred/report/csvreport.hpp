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

/*! \file hred/report/csvreport.hpp
    \brief CSV Report class
    \ingroup report
*/

#pragma once

#include <hred/report/report.hpp>

#include <fstream>
#include <vector>

namespace hre {
namespace data {

class ReportTypePrinter;

//! Report written line by line to a delimited text file
/*! Files written by this class can be read back with CSVFileReader: a string field that contains the separator,
    a double quote, a backslash or a line break is enclosed in double quotes, with embedded quotes and
    backslashes escaped by a backslash.
    \ingroup report
*/
class CSVFileReport : public Report {
public:
    /*! Create a report with the given filename, will throw if it cannot open the file.
        \param filename         name of the csv file that is created
        \param sep              separator character, defaults to a comma
        \param commentCharacter if \c true, the header line starts with \c #
        \param quoteChar        if given, all string fields are enclosed in this character
        \param nullString       representation of \c QuantLib::Null and non finite values
        \param lowerHeader      if \c true, the first character of each header is lower case
    */
    CSVFileReport(const string& filename, const char sep = ',', const bool commentCharacter = true,
                  char quoteChar = '\0', const std::string& nullString = "#N/A", bool lowerHeader = false);
    ~CSVFileReport();

    Report& addColumn(const string& name, const ReportType& rt, Size precision = 0) override;
    Report& next() override;
    Report& add(const ReportType& rt) override;
    void end() override;
    void flush() override;

    const std::string& fileName() const { return filename_; }

private:
    void checkIsOpen(const std::string& op) const;

    std::string filename_;
    char sep_;
    bool commentCharacter_;
    char quoteChar_;
    std::string nullString_;
    bool lowerHeader_;
    std::ofstream file_;
    std::vector<ReportType> columnTypes_;
    std::vector<ReportTypePrinter> printers_;
    Size i_;
    bool finalized_;
};

} // namespace data
} // namespace hre
