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

/*! \file hrea/app/hreapp.hpp
  \brief Hedge analytics app
  \ingroup app
 */

#pragma once

#include <hrea/app/hedgeanalysis.hpp>
#include <hrea/app/parameters.hpp>

#include <boost/filesystem/path.hpp>

#include <string>

namespace hre {
namespace analytics {

//! Orchestrates a hedge analysis from a parameter file: input loading, valuation, aggregation and reporting
/*! The valuation is replayed from the csv files named in the \c Replay group. Outputs written to the output path
    are the hedge report \c hedge.csv, the text summary \c summary.txt and the log file.
    \ingroup app
 */
class HREApp {
public:
    HREApp(const QuantLib::ext::shared_ptr<Parameters>& params, bool console = false,
           const boost::filesystem::path& logRootPath = boost::filesystem::path());

    //! Destructor
    virtual ~HREApp();

    //! Runs the analysis and writes the reports, returns false if the run failed
    virtual bool run();

    //! sensitivities of the last successful run
    const HedgeSensitivities& sensitivities() const { return sensitivities_; }

    //! time for executing run() in seconds
    QuantLib::Real getRunTime() const { return runTime_; }

    std::string version() const;

protected:
    virtual void analytics();
    //! set up logging
    void setupLog(const std::string& path, const std::string& file, unsigned mask,
                  const boost::filesystem::path& logRootPath);
    //! remove logs
    void closeLog();

    QuantLib::ext::shared_ptr<Parameters> params_;
    HedgeAnalysisParameters inputs_;
    bool console_;
    boost::filesystem::path logRootPath_;
    HedgeSensitivities sensitivities_;
    QuantLib::Real runTime_;
};

} // namespace analytics
} // namespace hre
