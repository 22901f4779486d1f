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

/*! \file hred/utilities/csvfilereader.hpp
    \brief utility class to access CSV files
    \ingroup utilities
*/

#pragma once

#include <ql/types.hpp>

#include <boost/tokenizer.hpp>

#include <fstream>
#include <string>
#include <vector>

namespace hre {
namespace data {

//! Sequential reader for delimited text files
/*! Lines starting with '#' are treated as comments, except for the header line which may start with '#'.
    Empty lines are skipped.
    \ingroup utilities
 */
class CSVFileReader {
public:
    /*! Ctor for a file with header line (the fields can be accessed by name) or without (access by column only) */
    CSVFileReader(const std::string& fileName, const bool firstLineContainsHeaders,
                  const std::string& delimiters = ",;\t", const std::string& escapeCharacters = "\\",
                  const std::string& quoteCharacters = "\"");

    //! Returns the fields, if a header line is present, otherwise throws
    const std::vector<std::string>& fields() const;
    //! Return true if a field is present
    bool hasField(const std::string& field) const;
    //! Returns the number of columns
    QuantLib::Size numberOfColumns() const;
    //! Go to next line in file, returns false if there are no more lines
    bool next();
    //! Number of the current data line (zero based)
    QuantLib::Size currentLine() const;
    //! Get content of field in current data line, throws if field is not present
    std::string get(const std::string& field) const;
    //! Get content of column in current data line, throws if column is out of range
    std::string get(const QuantLib::Size column) const;
    //! Close the file
    void close();

private:
    std::string fileName_;
    bool firstLineContainsHeaders_;
    boost::escaped_list_separator<char> tokenizer_;
    std::ifstream file_;
    std::vector<std::string> headers_, data_;
    QuantLib::Size numberOfColumns_, currentLine_;
    bool open_;
};

} // namespace data
} // namespace hre
