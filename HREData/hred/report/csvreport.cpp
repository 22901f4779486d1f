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
#include <hred/utilities/log.hpp>
#include <hred/utilities/to_string.hpp>

#include <ql/errors.hpp>
#include <ql/math/comparison.hpp>
#include <ql/math/rounding.hpp>
#include <ql/utilities/null.hpp>

#include <boost/variant/static_visitor.hpp>

#include <cctype>
#include <cmath>
#include <iomanip>

using std::string;

namespace hre {
namespace data {

// Prints the values of one column
class ReportTypePrinter : public boost::static_visitor<> {
public:
    ReportTypePrinter(std::ostream& out, Size precision, char sep, char quoteChar, const string& nullString)
        : out_(&out), precision_(precision), rounding_(static_cast<QuantLib::Integer>(precision),
                                                       QuantLib::Rounding::Closest),
          sep_(sep), quoteChar_(quoteChar), null_(nullString) {}

    void operator()(const Size i) const {
        if (i == QuantLib::Null<Size>())
            *out_ << null_;
        else
            *out_ << i;
    }
    void operator()(const Real d) const {
        if (d == QuantLib::Null<Real>() || !std::isfinite(d)) {
            *out_ << null_;
            return;
        }
        Real r = rounding_(d);
        // no negative zero
        *out_ << std::fixed << std::setprecision(static_cast<int>(precision_))
              << (QuantLib::close_enough(r, 0.0) ? 0.0 : r);
    }
    void operator()(const string& s) const { printString(s); }
    void operator()(const Date& d) const {
        if (d == QuantLib::Null<Date>())
            *out_ << null_;
        else
            printString(to_string(d));
    }

private:
    bool needsEscaping(const string& s) const {
        return s.find_first_of(string(1, sep_) + "\"\\n\r") != string::npos;
    }

    void printString(const string& s) const {
        if (quoteChar_ != '\0') {
            // already quoted strings are written as they are
            bool quoted = s.size() > 1 && s.front() == quoteChar_ && s.back() == quoteChar_;
            if (quoted)
                *out_ << s;
            else
                *out_ << quoteChar_ << s << quoteChar_;
        } else if (needsEscaping(s)) {
            *out_ << '"';
            for (char c : s) {
                if (c == '"' || c == '\\')
                    *out_ << '\\';
                *out_ << c;
            }
            *out_ << '"';
        } else {
            *out_ << s;
        }
    }

    std::ostream* out_;
    Size precision_;
    QuantLib::Rounding rounding_;
    char sep_;
    char quoteChar_;
    string null_;
};

CSVFileReport::CSVFileReport(const string& filename, const char sep, const bool commentCharacter, char quoteChar,
                             const string& nullString, bool lowerHeader)
    : filename_(filename), sep_(sep), commentCharacter_(commentCharacter), quoteChar_(quoteChar),
      nullString_(nullString), lowerHeader_(lowerHeader), i_(0), finalized_(false) {
    LOG("Opening CSV file report '" << filename_ << "'");
    file_.open(filename_.c_str(), std::ios_base::out | std::ios_base::trunc);
    QL_REQUIRE(file_.is_open(), "Error opening file '" << filename_ << "'");
}

CSVFileReport::~CSVFileReport() {
    if (!finalized_) {
        WLOG("CSV file report '" << filename_ << "' was not finalized, call end() on the report instance.");
        try {
            end();
        } catch (const std::exception& e) {
            ALOG("CSV file report '" << filename_ << "' could not be finalized: " << e.what());
        }
    }
}

void CSVFileReport::flush() {
    checkIsOpen("flush()");
    DLOG("CSV file report '" << filename_ << "' is flushed");
    file_.flush();
}

Report& CSVFileReport::addColumn(const string& name, const ReportType& rt, Size precision) {
    checkIsOpen("addColumn(" + name + ")");
    columnTypes_.push_back(rt);
    printers_.push_back(ReportTypePrinter(file_, precision, sep_, quoteChar_, nullString_));
    if (i_ == 0 && commentCharacter_)
        file_ << '#';
    if (i_ > 0)
        file_ << sep_;
    string header = name;
    if (lowerHeader_ && !header.empty())
        header[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(header[0])));
    file_ << header;
    i_++;
    return *this;
}

Report& CSVFileReport::next() {
    checkIsOpen("next()");
    QL_REQUIRE(i_ == columnTypes_.size(), "Cannot go to next line, only " << i_ << " entries filled");
    file_ << '\n';
    i_ = 0;
    return *this;
}

Report& CSVFileReport::add(const ReportType& rt) {
    checkIsOpen("add()");
    QL_REQUIRE(i_ < columnTypes_.size(), "No column to add [" << rt << "] to.");
    QL_REQUIRE(rt.which() == columnTypes_[i_].which(), "Cannot add value " << rt << " of type " << rt.which()
                                                                           << " to column " << i_ << " of type "
                                                                           << columnTypes_[i_].which());
    if (i_ != 0)
        file_ << sep_;
    boost::apply_visitor(printers_[i_], rt);
    i_++;
    return *this;
}

void CSVFileReport::end() {
    checkIsOpen("end()");
    finalized_ = true;
    file_ << '\n';
    file_.close();
    if (file_.fail()) {
        ALOG("CSV file report '" << filename_ << "' could not be written completely");
    } else {
        LOG("CSV file report '" << filename_ << "' closed.");
    }
    QL_REQUIRE(i_ == columnTypes_.size() || i_ == 0, "csv report is finalized with incomplete row, got data for "
                                                         << i_ << " columns out of " << columnTypes_.size());
}

void CSVFileReport::checkIsOpen(const std::string& op) const {
    QL_REQUIRE(!finalized_,
               "CSV file report '" << filename_ << "' is already finalized, can not process operation " << op);
}

} // namespace data
} // namespace hre
