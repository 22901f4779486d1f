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

/*! \file hrea/app/hedgeanalysis.hpp
    \brief Valuation of a contract and computation of its hedge
    \ingroup app
*/

#pragma once

#include <hrea/app/parameters.hpp>
#include <hrea/engine/completionsynchronizer.hpp>
#include <hrea/engine/sensitivityaggregator.hpp>
#include <hrea/engine/valuationprogress.hpp>
#include <hrea/valuation/valuationservice.hpp>

#include <hred/utilities/progressbar.hpp>

#include <ql/shared_ptr.hpp>

#include <mutex>
#include <string>
#include <vector>

namespace hre {
namespace analytics {

//! Runs a valuation on the valuation service and turns the perturbed results into a hedge
/*! The contract is compiled, the market calibrated and simulated, then the valuation is started. While the
    valuation runs its progress is tracked from the unit of work notifications, and the analysis blocks until
    the result is stored. The result is aggregated into hedge periods.

    A period with non finite hedge quantities is logged as a structured error and fails the run.
    \ingroup app
 */
class HedgeAnalysis {
public:
    HedgeAnalysis(const QuantLib::ext::shared_ptr<ValuationService>& service, const HedgeAnalysisParameters& params);

    //! value the contract given by its source code and compute the hedge
    HedgeSensitivities run(const std::string& sourceCode);

    //! aborts a running wait for the valuation result, can be called from any thread
    void cancel();

    //! add an indicator that receives the progress of the valuation
    void registerProgressIndicator(const QuantLib::ext::shared_ptr<hre::data::ProgressIndicator>& indicator);

    //! progress tracker of the last run
    const QuantLib::ext::shared_ptr<ValuationProgressTracker>& progressTracker() const { return tracker_; }

    //! time for compiling the contract in the last run, in seconds
    QuantLib::Real compilationTime() const { return compilationTime_; }
    //! time for valuation and aggregation in the last run, in seconds
    QuantLib::Real resultsTime() const { return resultsTime_; }

private:
    QuantLib::ext::shared_ptr<ValuationService> service_;
    HedgeAnalysisParameters params_;
    std::vector<QuantLib::ext::shared_ptr<hre::data::ProgressIndicator>> indicators_;
    QuantLib::ext::shared_ptr<ValuationProgressTracker> tracker_;
    QuantLib::ext::shared_ptr<CompletionSynchronizer> synchronizer_;
    bool cancelled_;
    std::mutex mutex_;
    QuantLib::Real compilationTime_, resultsTime_;
};

} // namespace analytics
} // namespace hre
