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

#include <hrea/valuation/resultstore.hpp>

#include <hred/utilities/log.hpp>

#include <ql/errors.hpp>

#include <boost/thread/lock_types.hpp>

namespace hre {
namespace analytics {

bool InMemoryResultStore::has(const std::string& id) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return results_.find(id) != results_.end();
}

ValuationResult InMemoryResultStore::get(const std::string& id) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    auto it = results_.find(id);
    QL_REQUIRE(it != results_.end(), "InMemoryResultStore: no result with id '" << id << "'");
    return it->second;
}

void InMemoryResultStore::add(const std::string& id, const ValuationResult& result) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    QL_REQUIRE(results_.find(id) == results_.end(), "InMemoryResultStore: result with id '" << id << "' exists");
    results_[id] = result;
    DLOG("InMemoryResultStore: added result " << id);
}

void InMemoryResultStore::clear() {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    results_.clear();
}

bool InMemorySimulatedPriceStore::has(const std::string& id) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return prices_.find(id) != prices_.end();
}

SimulatedPrice InMemorySimulatedPriceStore::get(const std::string& id) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    auto it = prices_.find(id);
    QL_REQUIRE(it != prices_.end(), "InMemorySimulatedPriceStore: no simulated price with id '" << id << "'");
    return it->second;
}

void InMemorySimulatedPriceStore::add(const SimulatedPrice& price) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    QL_REQUIRE(prices_.find(price.id) == prices_.end(),
               "InMemorySimulatedPriceStore: simulated price with id '" << price.id << "' exists");
    prices_[price.id] = price;
}

QuantLib::Size InMemorySimulatedPriceStore::size() const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return prices_.size();
}

} // namespace analytics
} // namespace hre
