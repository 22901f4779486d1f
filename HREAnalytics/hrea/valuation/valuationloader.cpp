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

#include <hrea/valuation/valuationloader.hpp>

#include <hred/utilities/csvfilereader.hpp>
#include <hred/utilities/log.hpp>
#include <hred/utilities/parsers.hpp>

#include <ql/errors.hpp>

using hre::data::CSVFileReader;
using hre::data::parseDate;
using hre::data::parseInteger;
using hre::data::parseReal;
using QuantLib::Array;
using QuantLib::Real;
using QuantLib::Size;
using std::map;
using std::string;

namespace hre {
namespace analytics {

namespace {

Size parsePath(const string& s) {
    QuantLib::Integer p = parseInteger(s);
    QL_REQUIRE(p >= 0, "path index must be non-negative, got " << p);
    return static_cast<Size>(p);
}

// converts path -> value samples into an array, the paths must be 0, 1, ..., n-1
Array toArray(const map<Size, Real>& samples, const string& label) {
    QL_REQUIRE(!samples.empty(), "no samples for " << label);
    Size n = samples.rbegin()->first + 1;
    QL_REQUIRE(samples.size() == n,
               "incomplete samples for " << label << ": got " << samples.size() << " paths, expected " << n);
    Array a(n);
    for (auto const& s : samples)
        a[s.first] = s.second;
    return a;
}

void addSample(map<Size, Real>& samples, Size path, Real value, const string& label) {
    QL_REQUIRE(samples.insert(std::make_pair(path, value)).second,
               "duplicate sample for path " << path << " of " << label);
}

} // namespace

ValuationCsvLoader::ValuationCsvLoader(const string& fairValueFile, const string& perturbedValuesFile,
                                       const string& simulatedPricesFile, const string& callCostsFile) {
    loadFairValue(fairValueFile);
    loadPerturbedValues(perturbedValuesFile);
    loadSimulatedPrices(simulatedPricesFile);
    loadCallCosts(callCostsFile);
}

void ValuationCsvLoader::loadFairValue(const string& fileName) {
    LOG("ValuationCsvLoader: loading fair value from " << fileName);
    CSVFileReader reader(fileName, true);
    if (reader.hasField("Path")) {
        map<Size, Real> samples;
        while (reader.next())
            addSample(samples, parsePath(reader.get("Path")), parseReal(reader.get("Value")), "fair value");
        result_.fairValue = toArray(samples, "fair value");
    } else {
        QL_REQUIRE(reader.next(), "ValuationCsvLoader: no fair value in " << fileName);
        result_.fairValue = parseReal(reader.get("Value"));
        QL_REQUIRE(!reader.next(), "ValuationCsvLoader: more than one scalar fair value in " << fileName);
    }
    reader.close();
}

void ValuationCsvLoader::loadPerturbedValues(const string& fileName) {
    LOG("ValuationCsvLoader: loading perturbed values from " << fileName);
    CSVFileReader reader(fileName, true);
    map<string, map<Size, Real>> samples;
    while (reader.next()) {
        string key = reader.get("Key");
        addSample(samples[key], parsePath(reader.get("Path")), parseReal(reader.get("Value")), key);
    }
    reader.close();
    for (auto const& s : samples)
        result_.perturbedValues[s.first] = toArray(s.second, "perturbed value " + s.first);
    LOG("ValuationCsvLoader: loaded " << result_.perturbedValues.size() << " perturbed values");
}

void ValuationCsvLoader::loadSimulatedPrices(const string& fileName) {
    LOG("ValuationCsvLoader: loading simulated prices from " << fileName);
    CSVFileReader reader(fileName, true);
    map<std::pair<string, QuantLib::Date>, map<Size, Real>> samples;
    while (reader.next()) {
        auto key = std::make_pair(reader.get("Commodity"), parseDate(reader.get("Date")));
        addSample(samples[key], parsePath(reader.get("Path")), parseReal(reader.get("Value")),
                  "simulated price " + key.first);
    }
    reader.close();
    for (auto const& s : samples) {
        SimulatedPrice p;
        p.commodity = s.first.first;
        p.date = s.first.second;
        p.value = toArray(s.second, "simulated price " + p.commodity);
        prices_.push_back(p);
    }
    LOG("ValuationCsvLoader: loaded " << prices_.size() << " simulated prices");
}

void ValuationCsvLoader::loadCallCosts(const string& fileName) {
    LOG("ValuationCsvLoader: loading call costs from " << fileName);
    CSVFileReader reader(fileName, true);
    while (reader.next()) {
        QuantLib::Integer cost = parseInteger(reader.get("Cost"));
        QL_REQUIRE(cost >= 0, "ValuationCsvLoader: negative cost " << cost << " for node " << reader.get("Node"));
        QL_REQUIRE(callCosts_.insert(std::make_pair(reader.get("Node"), static_cast<Size>(cost))).second,
                   "ValuationCsvLoader: duplicate node " << reader.get("Node"));
    }
    reader.close();
}

} // namespace analytics
} // namespace hre
