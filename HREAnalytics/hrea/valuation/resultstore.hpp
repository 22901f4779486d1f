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

/*! \file hrea/valuation/resultstore.hpp
    \brief Stores for valuation results and simulated prices
    \ingroup valuation
*/

#pragma once

#include <hrea/valuation/valuationresult.hpp>

#include <boost/thread/shared_mutex.hpp>

#include <map>
#include <string>

namespace hre {
namespace analytics {

//! Read access to the results of contract valuations, keyed by result id
/*! \ingroup valuation
 */
class ResultStore {
public:
    virtual ~ResultStore() {}
    //! true if a result with the given id is stored
    virtual bool has(const std::string& id) const = 0;
    //! returns a copy of the result, throws if no such result is stored
    virtual ValuationResult get(const std::string& id) const = 0;
};

//! Read access to simulated prices, keyed by simulated price id
/*! \ingroup valuation
 */
class SimulatedPriceStore {
public:
    virtual ~SimulatedPriceStore() {}
    virtual bool has(const std::string& id) const = 0;
    virtual SimulatedPrice get(const std::string& id) const = 0;
};

//! Thread safe in memory result store
/*! \ingroup valuation
 */
class InMemoryResultStore : public ResultStore {
public:
    bool has(const std::string& id) const override;
    ValuationResult get(const std::string& id) const override;
    //! adds a result, throws if a result with the same id exists
    void add(const std::string& id, const ValuationResult& result);
    void clear();

private:
    std::map<std::string, ValuationResult> results_;
    mutable boost::shared_mutex mutex_;
};

//! Thread safe in memory simulated price store
/*! \ingroup valuation
 */
class InMemorySimulatedPriceStore : public SimulatedPriceStore {
public:
    bool has(const std::string& id) const override;
    SimulatedPrice get(const std::string& id) const override;
    //! adds a price under its id, throws if a price with the same id exists
    void add(const SimulatedPrice& price);
    QuantLib::Size size() const;

private:
    std::map<std::string, SimulatedPrice> prices_;
    mutable boost::shared_mutex mutex_;
};

} // namespace analytics
} // namespace hre
