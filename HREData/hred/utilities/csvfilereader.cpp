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

#include <hred/utilities/csvfilereader.hpp>
#include <hred/utilities/log.hpp>

#include <ql/errors.hpp>
#include <ql/utilities/null.hpp>

#include <boost/algorithm/string.hpp>

#include <algorithm>

namespace hre {
namespace data {

CSVFileReader::CSVFileReader(const std::string& fileName, const bool firstLineContainsHeaders,
                             const std::string& delimiters, const std::string& escapeCharacters,
                             const std::string& quoteCharacters)
    : fileName_(fileName), firstLineContainsHeaders_(firstLineContainsHeaders),
      tokenizer_(escapeCharacters, delimiters, quoteCharacters), numberOfColumns_(QuantLib::Null<QuantLib::Size>()),
      currentLine_(QuantLib::Null<QuantLib::Size>()), open_(false) {
    file_.open(fileName_.c_str());
    QL_REQUIRE(file_.is_open(), "CSVFileReader: error opening file " << fileName_);
    open_ = true;
    LOG("CSVFileReader: opened file " << fileName_);
    if (firstLineContainsHeaders_) {
        std::string line;
        while (line.empty() && std::getline(file_, line))
            boost::trim(line);
        QL_REQUIRE(!line.empty(), "CSVFileReader: no header line found in file " << fileName_);
        if (line[0] == '#')
            line = line.substr(1);
        boost::tokenizer<boost::escaped_list_separator<char>> tok(line, tokenizer_);
        for (auto const& t : tok)
            headers_.push_back(boost::trim_copy(t));
        numberOfColumns_ = headers_.size();
        DLOG("CSVFileReader: found " << numberOfColumns_ << " columns in header of file " << fileName_);
    }
}

const std::vector<std::string>& CSVFileReader::fields() const {
    QL_REQUIRE(firstLineContainsHeaders_, "CSVFileReader: no headers specified");
    return headers_;
}

bool CSVFileReader::hasField(const std::string& field) const {
    return std::find(fields().begin(), fields().end(), field) != fields().end();
}

QuantLib::Size CSVFileReader::numberOfColumns() const { return numberOfColumns_; }

bool CSVFileReader::next() {
    QL_REQUIRE(open_, "CSVFileReader: file " << fileName_ << " is not open");
    data_.clear();
    std::string line;
    while (std::getline(file_, line)) {
        boost::trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        boost::tokenizer<boost::escaped_list_separator<char>> tok(line, tokenizer_);
        for (auto const& t : tok)
            data_.push_back(boost::trim_copy(t));
        if (numberOfColumns_ == QuantLib::Null<QuantLib::Size>())
            numberOfColumns_ = data_.size();
        QL_REQUIRE(data_.size() == numberOfColumns_, "CSVFileReader: data line '"
                                                         << line << "' in file " << fileName_ << " has "
                                                         << data_.size() << " columns, expected " << numberOfColumns_);
        currentLine_ = currentLine_ == QuantLib::Null<QuantLib::Size>() ? 0 : currentLine_ + 1;
        return true;
    }
    return false;
}

QuantLib::Size CSVFileReader::currentLine() const { return currentLine_; }

std::string CSVFileReader::get(const std::string& field) const {
    QL_REQUIRE(!data_.empty(), "CSVFileReader: no current data line in file " << fileName_);
    auto it = std::find(fields().begin(), fields().end(), field);
    QL_REQUIRE(it != fields().end(), "CSVFileReader: field '" << field << "' not found in file " << fileName_);
    return data_.at(std::distance(fields().begin(), it));
}

std::string CSVFileReader::get(const QuantLib::Size column) const {
    QL_REQUIRE(!data_.empty(), "CSVFileReader: no current data line in file " << fileName_);
    QL_REQUIRE(column < data_.size(), "CSVFileReader: column " << column << " out of range 0..." << data_.size());
    return data_[column];
}

void CSVFileReader::close() {
    if (open_) {
        file_.close();
        open_ = false;
    }
}

} // namespace data
} // namespace hre
