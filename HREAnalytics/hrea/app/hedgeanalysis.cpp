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

#include <hrea/app/hedgeanalysis.hpp>
#include <hrea/app/structuredanalyticserror.hpp>

#include <hred/utilities/log.hpp>
#include <hred/utilities/to_string.hpp>

#include <ql/errors.hpp>

#include <boost/timer/timer.hpp>

#include <chrono>

using namespace QuantLib;
using namespace hre::data;
using std::string;

namespace hre {
namespace analytics {

namespace {
Real seconds(const boost::timer::cpu_timer& timer) {
    return static_cast<Real>(timer.elapsed().wall) * 1.0e-9;
}
} // namespace

HedgeAnalysis::HedgeAnalysis(const QuantLib::ext::shared_ptr<ValuationService>& service,
                             const HedgeAnalysisParameters& params)
    : service_(service), params_(params), cancelled_(false), compilationTime_(0.0), resultsTime_(0.0) {
    QL_REQUIRE(service_, "HedgeAnalysis: no valuation service given");
}

void HedgeAnalysis::registerProgressIndicator(const QuantLib::ext::shared_ptr<ProgressIndicator>& indicator) {
    indicators_.push_back(indicator);
}

void HedgeAnalysis::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    if (synchronizer_)
        synchronizer_->cancel();
}

HedgeSensitivities HedgeAnalysis::run(const string& sourceCode) {
    LOG("HedgeAnalysis: " << params_.title);

    boost::timer::cpu_timer timer;
    ContractSpecification spec = service_->compile(sourceCode);
    timer.stop();
    compilationTime_ = seconds(timer);
    LOG("Compilation in " << timer.format(2, "%w") << "s");

    timer.start();
    MarketCalibration calibration = service_->registerMarketCalibration(params_.priceProcess, params_.calibration);
    MarketSimulation simulation =
        service_->simulate(spec, calibration, params_.pathCount, params_.observationDate, params_.interestRate,
                           params_.perturbationFactor);
    LOG("HedgeAnalysis: simulation " << simulation.id << " with " << simulation.pathCount << " paths");

    Size totalCost = 0;
    for (auto const& c : service_->callCosts(spec.id))
        totalCost += c.second;
    LOG("HedgeAnalysis: " << totalCost << " units of work");

    tracker_ = QuantLib::ext::make_shared<ValuationProgressTracker>(totalCost, params_.windowFraction,
                                                                      params_.fallbackRate);
    for (auto const& i : indicators_)
        tracker_->registerProgressIndicator(i);

    auto synchronizer = QuantLib::ext::make_shared<CompletionSynchronizer>(
        service_->events(), service_->results(), std::chrono::milliseconds(params_.pollTimeout),
        std::chrono::milliseconds(params_.totalBudget));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_)
            synchronizer->cancel();
        synchronizer_ = synchronizer;
    }

    ValuationResult result;
    {
        QuantLib::ext::shared_ptr<ValuationProgressTracker> tracker = tracker_;
        ScopedSubscription progress(service_->events(), &ValuationProgressTracker::isUnitOfWorkCompleted,
                                    [tracker](const ValuationEvent&) { tracker->onUnitCompleted(); });
        ValuationHandle handle = service_->evaluate(spec, simulation);
        result = synchronizer->waitFor(makeResultId(handle.id, spec.id));
    }
    LOG("HedgeAnalysis: " << tracker_->snapshot());

    SensitivityAggregator aggregator(params_.perturbationFactor, params_.pathCount, params_.observationDate);
    HedgeSensitivities sensitivities =
        aggregator.aggregate(result, SensitivityAggregator::priceLookup(service_->prices(), simulation.id));

    Size faults = 0;
    for (auto const& p : sensitivities.periods) {
        if (p.numericFault) {
            StructuredAnalyticsErrorMessage(
                "HedgeAnalysis", "Numeric fault", "non finite hedge quantities",
                {{"key", p.key}, {"perturbationFactor", hre::data::to_string(params_.perturbationFactor)}})
                .log();
            ++faults;
        }
    }
    QL_REQUIRE(faults == 0, "HedgeAnalysis: non finite hedge quantities in " << faults << " periods");

    timer.stop();
    resultsTime_ = seconds(timer);
    LOG("Results in " << timer.format(2, "%w") << "s");
    return sensitivities;
}

} // namespace analytics
} // namespace hre
