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

#include <hrea/valuation/replayvaluationservice.hpp>

#include <hred/utilities/log.hpp>

#include <ql/errors.hpp>

#include <algorithm>
#include <future>
#include <numeric>

namespace hre {
namespace analytics {

ReplayValuationService::ReplayValuationService(const ValuationResult& result,
                                               const std::vector<SimulatedPrice>& prices,
                                               const std::map<std::string, QuantLib::Size>& callCosts,
                                               const std::chrono::microseconds& unitDelay,
                                               const QuantLib::Size nThreads)
    : result_(result), simulatedPrices_(prices), callCosts_(callCosts), unitDelay_(unitDelay), nThreads_(nThreads),
      failed_(0), counter_(0) {
    QL_REQUIRE(nThreads_ > 0, "ReplayValuationService: number of threads must be positive");
}

ReplayValuationService::~ReplayValuationService() { wait(); }

std::string ReplayValuationService::nextId(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    return prefix + "-" + std::to_string(++counter_);
}

ContractSpecification ReplayValuationService::compile(const std::string& source) {
    ContractSpecification spec{nextId("spec"), source};
    std::lock_guard<std::mutex> lock(mutex_);
    specifications_[spec.id] = spec;
    DLOG("ReplayValuationService: compiled contract specification " << spec.id);
    return spec;
}

MarketCalibration ReplayValuationService::registerMarketCalibration(
    const std::string& priceProcessName, const std::map<std::string, std::string>& parameters) {
    MarketCalibration calibration{nextId("calibration"), priceProcessName, parameters};
    DLOG("ReplayValuationService: registered market calibration " << calibration.id << " for price process "
                                                                  << priceProcessName);
    return calibration;
}

MarketSimulation ReplayValuationService::simulate(const ContractSpecification& contractSpecification,
                                                  const MarketCalibration& marketCalibration,
                                                  QuantLib::Size pathCount, const QuantLib::Date& observationDate,
                                                  QuantLib::Real interestRate, QuantLib::Real perturbationFactor) {
    MarketSimulation simulation{nextId("simulation"), contractSpecification.id, marketCalibration.id, pathCount,
                                observationDate, interestRate, perturbationFactor};
    for (auto const& p : simulatedPrices_) {
        QL_REQUIRE(p.value.size() == pathCount, "ReplayValuationService: simulated price of "
                                                    << p.commodity << " at " << p.date << " has " << p.value.size()
                                                    << " samples, expected path count " << pathCount);
        SimulatedPrice price = p;
        price.id = makeSimulatedPriceId(simulation.id, p.commodity, p.date, p.date);
        prices_.add(price);
    }
    LOG("ReplayValuationService: simulation " << simulation.id << " with " << pathCount << " paths, "
                                              << simulatedPrices_.size() << " simulated prices");
    return simulation;
}

std::map<std::string, QuantLib::Size> ReplayValuationService::callCosts(const std::string& contractSpecificationId) {
    std::lock_guard<std::mutex> lock(mutex_);
    QL_REQUIRE(specifications_.find(contractSpecificationId) != specifications_.end(),
               "ReplayValuationService: unknown contract specification '" << contractSpecificationId << "'");
    return callCosts_;
}

ValuationHandle ReplayValuationService::evaluate(const ContractSpecification& contractSpecification,
                                                 const MarketSimulation& marketSimulation) {
    ValuationHandle handle{nextId("valuation"), contractSpecification.id, marketSimulation.id};
    LOG("ReplayValuationService: starting valuation " << handle.id);
    std::lock_guard<std::mutex> lock(mutex_);
    valuations_.emplace_back(&ReplayValuationService::run, this, handle);
    return handle;
}

void ReplayValuationService::run(const ValuationHandle& handle) {
    QuantLib::Size totalUnits = std::accumulate(
        callCosts_.begin(), callCosts_.end(), QuantLib::Size(0),
        [](QuantLib::Size s, const std::pair<const std::string, QuantLib::Size>& c) { return s + c.second; });

    // split the units of work into nThreads chunks of (almost) equal size
    QuantLib::Size effThreads = std::max<QuantLib::Size>(1, std::min(nThreads_, totalUnits));
    std::vector<std::future<int>> results;
    std::vector<std::thread> jobs;
    for (QuantLib::Size i = 0; i < effThreads; ++i) {
        QuantLib::Size units = totalUnits / effThreads + (i < totalUnits % effThreads ? 1 : 0);
        std::packaged_task<int(QuantLib::Size)> task([this, &handle](QuantLib::Size units) {
            try {
                for (QuantLib::Size u = 0; u < units; ++u) {
                    if (unitDelay_.count() > 0)
                        std::this_thread::sleep_for(unitDelay_);
                    events_.publish(ValuationEvent(ValuationEvent::Type::UnitOfWorkCompleted, handle.id));
                }
                return 0;
            } catch (const std::exception& e) {
                ALOG("ReplayValuationService: worker of valuation " << handle.id << " failed: " << e.what());
                return 1;
            }
        });
        results.push_back(task.get_future());
        jobs.emplace_back(std::move(task), units);
    }

    int rc = 0;
    for (QuantLib::Size i = 0; i < jobs.size(); ++i) {
        jobs[i].join();
        rc += results[i].get();
    }

    if (rc != 0) {
        ++failed_;
        ALOG("ReplayValuationService: valuation " << handle.id << " failed, no result is stored");
        return;
    }

    std::string resultId = makeResultId(handle.id, handle.contractSpecificationId);
    try {
        results_.add(resultId, result_);
    } catch (const std::exception& e) {
        ++failed_;
        ALOG("ReplayValuationService: could not store result " << resultId << ": " << e.what());
        return;
    }
    LOG("ReplayValuationService: valuation " << handle.id << " finished, result " << resultId);
    events_.publish(ValuationEvent(ValuationEvent::Type::ResultCreated, resultId));
}

void ReplayValuationService::wait() {
    std::vector<std::thread> valuations;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        valuations.swap(valuations_);
    }
    for (auto& t : valuations) {
        if (t.joinable())
            t.join();
    }
}

} // namespace analytics
} // namespace hre
