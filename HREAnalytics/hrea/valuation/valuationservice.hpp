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

/*! \file hrea/valuation/valuationservice.hpp
    \brief Interface to the Monte Carlo contract valuation engine
    \ingroup valuation
*/

#pragma once

#include <hrea/valuation/resultstore.hpp>
#include <hrea/valuation/valuationevents.hpp>

#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <map>
#include <string>

namespace hre {
namespace analytics {

//! Compiled contract
struct ContractSpecification {
    std::string id;
    std::string source;
};

//! Calibrated price process
struct MarketCalibration {
    std::string id;
    std::string priceProcessName;
    std::map<std::string, std::string> parameters;
};

//! Simulated market the contract is valued in
struct MarketSimulation {
    std::string id;
    std::string contractSpecificationId;
    std::string marketCalibrationId;
    QuantLib::Size pathCount;
    QuantLib::Date observationDate;
    QuantLib::Real interestRate;
    QuantLib::Real perturbationFactor;
};

//! Handle of a running valuation
struct ValuationHandle {
    std::string id;
    std::string contractSpecificationId;
    std::string marketSimulationId;
};

//! Monte Carlo contract valuation engine
/*! The engine compiles contracts, simulates market paths and values contracts asynchronously. While a valuation
    runs the engine publishes a \c UnitOfWorkCompleted event per computed node value, and once the result is
    stored under \c makeResultId(valuation id, specification id) a \c ResultCreated event carrying that id.

    The result is always stored before the \c ResultCreated event is published.
    \ingroup valuation
 */
class ValuationService {
public:
    virtual ~ValuationService() {}

    virtual ContractSpecification compile(const std::string& source) = 0;

    virtual MarketCalibration registerMarketCalibration(const std::string& priceProcessName,
                                                        const std::map<std::string, std::string>& parameters) = 0;

    virtual MarketSimulation simulate(const ContractSpecification& contractSpecification,
                                      const MarketCalibration& marketCalibration, QuantLib::Size pathCount,
                                      const QuantLib::Date& observationDate, QuantLib::Real interestRate,
                                      QuantLib::Real perturbationFactor) = 0;

    //! estimated cost of each node of the compiled contract, the sum is the number of units of work
    virtual std::map<std::string, QuantLib::Size> callCosts(const std::string& contractSpecificationId) = 0;

    //! starts the valuation and returns immediately
    virtual ValuationHandle evaluate(const ContractSpecification& contractSpecification,
                                     const MarketSimulation& marketSimulation) = 0;

    virtual ValuationEventSource& events() = 0;
    virtual const ResultStore& results() const = 0;
    virtual const SimulatedPriceStore& prices() const = 0;
};

} // namespace analytics
} // namespace hre
