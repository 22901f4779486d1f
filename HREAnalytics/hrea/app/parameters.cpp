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

#include <hrea/app/parameters.hpp>

#include <hred/utilities/log.hpp>
#include <hred/utilities/parsers.hpp>

#include <ql/errors.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <sstream>

using QuantLib::Size;
using namespace hre::data;
namespace pt = boost::property_tree;

namespace hre {
namespace analytics {

bool Parameters::hasGroup(const string& groupName) const { return (data_.find(groupName) != data_.end()); }

bool Parameters::has(const string& groupName, const string& paramName) const {
    QL_REQUIRE(hasGroup(groupName), "param group '" << groupName << "' not found");
    auto it = data_.find(groupName);
    return (it->second.find(paramName) != it->second.end());
}

string Parameters::get(const string& groupName, const string& paramName, bool fail) const {
    if (fail) {
        QL_REQUIRE(has(groupName, paramName), "parameter " << paramName << " not found in param group " << groupName);
        auto it = data_.find(groupName);
        return it->second.find(paramName)->second;
    } else {
        if (!hasGroup(groupName) || !has(groupName, paramName))
            return "";
        auto it = data_.find(groupName);
        return it->second.find(paramName)->second;
    }
}

const map<string, string>& Parameters::data(const string& groupName) const {
    auto it = data_.find(groupName);
    QL_REQUIRE(it != data_.end(), "param group '" << groupName << "' not found");
    return it->second;
}

void Parameters::fromFile(const string& fileName) {
    LOG("load HRE configuration from " << fileName);
    clear();
    pt::ptree tree;
    try {
        pt::read_xml(fileName, tree, pt::xml_parser::trim_whitespace);
    } catch (const pt::xml_parser_error& e) {
        QL_FAIL("error reading parameter file " << fileName << ": " << e.what());
    }
    fromPropertyTree(tree);
    LOG("load HRE configuration from " << fileName << " done.");
}

void Parameters::fromXMLString(const string& xml) {
    clear();
    std::istringstream in(xml);
    pt::ptree tree;
    try {
        pt::read_xml(in, tree, pt::xml_parser::trim_whitespace);
    } catch (const pt::xml_parser_error& e) {
        QL_FAIL("error reading parameters: " << e.what());
    }
    fromPropertyTree(tree);
}

void Parameters::clear() { data_.clear(); }

void Parameters::fromPropertyTree(const pt::ptree& tree) {
    auto root = tree.get_child_optional("HRE");
    QL_REQUIRE(root, "node HRE not found in parameter file");
    for (auto const& group : *root) {
        if (group.first == "<xmlattr>" || group.first == "<xmlcomment>")
            continue;
        map<string, string> groupMap;
        for (auto const& param : group.second) {
            if (param.first != "Parameter")
                continue;
            auto key = param.second.get_optional<string>("<xmlattr>.name");
            QL_REQUIRE(key, "Parameter without name attribute in group " << group.first);
            groupMap[*key] = boost::algorithm::trim_copy(param.second.get_value<string>());
        }
        data_[boost::algorithm::to_lower_copy(group.first)] = groupMap;
    }
    QL_REQUIRE(hasGroup("setup"), "node Setup not found in parameter file");
}

void Parameters::log() {
    LOG("Parameters:");
    for (auto p : data_)
        for (auto pp : p.second)
            LOG("group = " << p.first << " : " << pp.first << " = " << pp.second);
}

namespace {
string getOrDefault(const Parameters& params, const string& group, const string& name, const string& defaultValue) {
    string s = params.get(group, name, false);
    return s.empty() ? defaultValue : s;
}

Size parseSize(const string& s, const string& name) {
    QuantLib::Integer i = parseInteger(s);
    QL_REQUIRE(i >= 0, name << " must not be negative, got " << s);
    return static_cast<Size>(i);
}
} // namespace

HedgeAnalysisParameters::HedgeAnalysisParameters()
    : inputPath("."), outputPath("."), logFile("log.txt"), logMask(HRE_ALERT | HRE_CRITICAL | HRE_ERROR | HRE_WARNING),
      title("Hedge"), interestRate(0.0), pathCount(1000), perturbationFactor(0.01),
      periodisation(Periodisation::Monthly), windowFraction(0.5), fallbackRate(0.001), pollTimeout(2000),
      totalBudget(0), progressBar(true), fairValueFile("fairvalue.csv"), perturbedValuesFile("perturbed.csv"),
      pricesFile("prices.csv"), callCostsFile("callcosts.csv"), unitDelay(0), threads(1) {}

HedgeAnalysisParameters::HedgeAnalysisParameters(const Parameters& params) : HedgeAnalysisParameters() {
    inputPath = getOrDefault(params, "setup", "inputPath", inputPath);
    outputPath = getOrDefault(params, "setup", "outputPath", outputPath);
    logFile = getOrDefault(params, "setup", "logFile", logFile);
    string tmp = params.get("setup", "logMask", false);
    if (!tmp.empty())
        logMask = static_cast<unsigned>(parseSize(tmp, "logMask"));

    QL_REQUIRE(params.hasGroup("valuation"), "node Valuation not found in parameter file");
    title = getOrDefault(params, "valuation", "title", title);
    sourceFile = params.get("valuation", "sourceFile");
    observationDate = parseDate(params.get("valuation", "observationDate"));
    interestRate = parseReal(params.get("valuation", "interestRate"));
    pathCount = parseSize(params.get("valuation", "pathCount"), "pathCount");
    QL_REQUIRE(pathCount > 0, "pathCount must be positive");
    perturbationFactor = parseReal(params.get("valuation", "perturbationFactor"));
    tmp = params.get("valuation", "periodisation", false);
    if (!tmp.empty())
        periodisation = parsePeriodisation(tmp);
    priceProcess = params.get("valuation", "priceProcess");
    if (params.hasGroup("calibration"))
        calibration = params.data("calibration");

    if (params.hasGroup("telemetry")) {
        tmp = params.get("telemetry", "windowFraction", false);
        if (!tmp.empty())
            windowFraction = parseReal(tmp);
        QL_REQUIRE(windowFraction > 0.0 && windowFraction <= 1.0,
                   "windowFraction must be in (0, 1], got " << windowFraction);
        tmp = params.get("telemetry", "fallbackRate", false);
        if (!tmp.empty())
            fallbackRate = parseReal(tmp);
        QL_REQUIRE(fallbackRate > 0.0, "fallbackRate must be positive, got " << fallbackRate);
        tmp = params.get("telemetry", "pollTimeout", false);
        if (!tmp.empty())
            pollTimeout = parseSize(tmp, "pollTimeout");
        QL_REQUIRE(pollTimeout > 0, "pollTimeout must be positive");
        tmp = params.get("telemetry", "totalBudget", false);
        if (!tmp.empty())
            totalBudget = parseSize(tmp, "totalBudget");
        tmp = params.get("telemetry", "progressBar", false);
        if (!tmp.empty())
            progressBar = parseBool(tmp);
    }

    if (params.hasGroup("replay")) {
        fairValueFile = getOrDefault(params, "replay", "fairValueFile", fairValueFile);
        perturbedValuesFile = getOrDefault(params, "replay", "perturbedValuesFile", perturbedValuesFile);
        pricesFile = getOrDefault(params, "replay", "pricesFile", pricesFile);
        callCostsFile = getOrDefault(params, "replay", "callCostsFile", callCostsFile);
        tmp = params.get("replay", "unitDelay", false);
        if (!tmp.empty())
            unitDelay = parseSize(tmp, "unitDelay");
        tmp = params.get("replay", "threads", false);
        if (!tmp.empty())
            threads = parseSize(tmp, "threads");
        QL_REQUIRE(threads > 0, "threads must be positive");
    }
}

} // namespace analytics
} // namespace hre
