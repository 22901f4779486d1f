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

/*! \file hrea/valuation/replayvaluationservice.hpp
    \brief In process valuation service replaying a precomputed valuation
    \ingroup valuation
*/

#pragma once

#include <hrea/valuation/valuationservice.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace hre {
namespace analytics {

//! Valuation service that replays a precomputed valuation result
/*! The service holds a valuation result, the simulated prices it was computed with and the call costs of the
    contract nodes. A call to evaluate() starts a background thread which spreads the units of work over
    \c nThreads worker threads. Each worker publishes one \c UnitOfWorkCompleted event per unit, waiting
    \c unitDelay before each. Once all workers are done the result is stored and \c ResultCreated is published.

    The simulated prices are registered in the price store by simulate(), with the simulation id in the key.
    \ingroup valuation
 */
class ReplayValuationService : public ValuationService {
public:
    ReplayValuationService(const ValuationResult& result, const std::vector<SimulatedPrice>& prices,
                           const std::map<std::string, QuantLib::Size>& callCosts,
                           const std::chrono::microseconds& unitDelay = std::chrono::microseconds(0),
                           const QuantLib::Size nThreads = 1);
    //! waits for all running valuations
    ~ReplayValuationService();

    ContractSpecification compile(const std::string& source) override;
    MarketCalibration registerMarketCalibration(const std::string& priceProcessName,
                                                const std::map<std::string, std::string>& parameters) override;
    MarketSimulation simulate(const ContractSpecification& contractSpecification,
                              const MarketCalibration& marketCalibration, QuantLib::Size pathCount,
                              const QuantLib::Date& observationDate, QuantLib::Real interestRate,
                              QuantLib::Real perturbationFactor) override;
    std::map<std::string, QuantLib::Size> callCosts(const std::string& contractSpecificationId) override;
    ValuationHandle evaluate(const ContractSpecification& contractSpecification,
                             const MarketSimulation& marketSimulation) override;

    ValuationEventSource& events() override { return events_; }
    const ResultStore& results() const override { return results_; }
    const SimulatedPriceStore& prices() const override { return prices_; }

    //! blocks until all valuations started so far are finished
    void wait();
    //! number of valuations that failed in a worker thread
    QuantLib::Size failedValuations() const { return failed_; }

private:
    void run(const ValuationHandle& handle);
    std::string nextId(const std::string& prefix);

    ValuationResult result_;
    std::vector<SimulatedPrice> simulatedPrices_;
    std::map<std::string, QuantLib::Size> callCosts_;
    std::chrono::microseconds unitDelay_;
    QuantLib::Size nThreads_;

    ValuationEventBroker events_;
    InMemoryResultStore results_;
    InMemorySimulatedPriceStore prices_;

    std::map<std::string, ContractSpecification> specifications_;
    std::vector<std::thread> valuations_;
    std::atomic<QuantLib::Size> failed_;
    QuantLib::Size counter_;
    std::mutex mutex_;
};

} // namespace analytics
} // namespace hre
