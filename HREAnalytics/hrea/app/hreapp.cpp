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

#include <hrea/app/hreapp.hpp>
#include <hrea/app/reportwriter.hpp>
#include <hrea/app/structuredanalyticserror.hpp>
#include <hrea/valuation/replayvaluationservice.hpp>
#include <hrea/valuation/valuationloader.hpp>
#include <hrea/version.hpp>

#include <hred/report/csvreport.hpp>
#include <hred/utilities/log.hpp>
#include <hred/utilities/progressbar.hpp>

#include <ql/errors.hpp>

#include <boost/filesystem/operations.hpp>
#include <boost/timer/timer.hpp>

#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

using namespace hre::data;
using std::string;

namespace hre {
namespace analytics {

namespace {
string fullPath(const string& path, const string& file) { return (boost::filesystem::path(path) / file).string(); }

string readSource(const string& fileName) {
    std::ifstream in(fileName.c_str());
    QL_REQUIRE(in.is_open(), "error opening contract source file " << fileName);
    std::ostringstream source;
    source << in.rdbuf();
    return source.str();
}
} // namespace

HREApp::HREApp(const QuantLib::ext::shared_ptr<Parameters>& params, bool console,
               const boost::filesystem::path& logRootPath)
    : params_(params), console_(console), logRootPath_(logRootPath), runTime_(0.0) {
    QL_REQUIRE(params_, "HREApp: no parameters given");
}

HREApp::~HREApp() { closeLog(); }

string HREApp::version() const { return string(HRE_VERSION); }

bool HREApp::run() {

    // Only one thread at a time should call run
    static std::mutex _s_mutex;
    std::lock_guard<std::mutex> lock(_s_mutex);

    boost::timer::cpu_timer timer;

    try {
        inputs_ = HedgeAnalysisParameters(*params_);
        setupLog(inputs_.outputPath, fullPath(inputs_.outputPath, inputs_.logFile), inputs_.logMask, logRootPath_);
        LOG("HRE starting, version " << version());
        params_->log();
        analytics();
    } catch (const std::exception& e) {
        StructuredAnalyticsErrorMessage("HREApp::run()", "Error", e.what()).log();
        if (console_)
            std::cout << "Error: " << e.what() << std::endl;
        return false;
    }

    timer.stop();
    runTime_ = static_cast<QuantLib::Real>(timer.elapsed().wall) * 1.0e-9;
    if (console_) {
        std::cout << "run time: " << timer.format(2, "%w") << " sec" << std::endl;
        std::cout << "HRE done." << std::endl;
    }
    LOG("HRE done.");
    return true;
}

void HREApp::analytics() {
    string source = readSource(fullPath(inputs_.inputPath, inputs_.sourceFile));

    ValuationCsvLoader loader(fullPath(inputs_.inputPath, inputs_.fairValueFile),
                              fullPath(inputs_.inputPath, inputs_.perturbedValuesFile),
                              fullPath(inputs_.inputPath, inputs_.pricesFile),
                              fullPath(inputs_.inputPath, inputs_.callCostsFile));
    auto service = QuantLib::ext::make_shared<ReplayValuationService>(
        loader.result(), loader.simulatedPrices(), loader.callCosts(),
        std::chrono::microseconds(inputs_.unitDelay), inputs_.threads);

    HedgeAnalysis analysis(service, inputs_);
    analysis.registerProgressIndicator(QuantLib::ext::make_shared<ProgressLog>("Valuation", 10));
    if (console_ && inputs_.progressBar)
        analysis.registerProgressIndicator(QuantLib::ext::make_shared<SimpleProgressBar>(inputs_.title));

    if (console_)
        std::cout << "Compiling " << inputs_.sourceFile << std::endl;
    sensitivities_ = analysis.run(source);
    if (console_) {
        std::cout << "Compilation in " << std::fixed << std::setprecision(2) << analysis.compilationTime() << "s"
                  << std::endl;
        std::cout << "Results in " << analysis.resultsTime() << "s" << std::endl;
        std::cout.unsetf(std::ios_base::floatfield);
    }

    ReportWriter writer;
    CSVFileReport hedgeReport(fullPath(inputs_.outputPath, "hedge.csv"));
    writer.writeHedgeReport(hedgeReport, sensitivities_, inputs_.periodisation);

    string summaryFile = fullPath(inputs_.outputPath, "summary.txt");
    std::ofstream summary(summaryFile.c_str());
    QL_REQUIRE(summary.is_open(), "error opening summary file " << summaryFile);
    summary << inputs_.title << std::endl;
    writer.writeSummary(summary, sensitivities_);
    if (console_)
        writer.writeSummary(std::cout, sensitivities_);
}

void HREApp::setupLog(const string& path, const string& file, unsigned mask,
                      const boost::filesystem::path& logRootPath) {
    closeLog();

    boost::filesystem::path p{path};
    if (!boost::filesystem::exists(p)) {
        boost::filesystem::create_directories(p);
    }
    QL_REQUIRE(boost::filesystem::is_directory(p), "output path '" << path << "' is not a directory.");

    Log::instance().registerLogger(QuantLib::ext::make_shared<FileLogger>(file));
    boost::filesystem::path hreRootPath =
        logRootPath.empty() ? boost::filesystem::path(__FILE__).parent_path().parent_path().parent_path().parent_path()
                            : logRootPath;
    Log::instance().setRootPath(hreRootPath);
    Log::instance().setMask(mask);
    Log::instance().switchOn();
}

void HREApp::closeLog() { Log::instance().removeAllLoggers(); }

} // namespace analytics
} // namespace hre
