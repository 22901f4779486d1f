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

#include <hrea/valuation/valuationevents.hpp>

#include <hred/utilities/log.hpp>

#include <ql/errors.hpp>

#include <boost/thread/lock_types.hpp>

namespace hre {
namespace analytics {

std::ostream& operator<<(std::ostream& out, const ValuationEvent::Type& type) {
    switch (type) {
    case ValuationEvent::Type::UnitOfWorkCompleted:
        return out << "UnitOfWorkCompleted";
    case ValuationEvent::Type::ResultCreated:
        return out << "ResultCreated";
    default:
        QL_FAIL("unknown valuation event type " << static_cast<int>(type));
    }
}

ScopedSubscription::ScopedSubscription(ValuationEventSource& source, const ValuationEventSource::Filter& filter,
                                       const ValuationEventSource::Handler& handler)
    : source_(source), id_(source.subscribe(filter, handler)), active_(true) {}

ScopedSubscription::~ScopedSubscription() { release(); }

void ScopedSubscription::release() {
    if (active_) {
        source_.unsubscribe(id_);
        active_ = false;
    }
}

QuantLib::Size ValuationEventBroker::subscribe(const Filter& filter, const Handler& handler) {
    QL_REQUIRE(handler, "ValuationEventBroker: no handler given");
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    QuantLib::Size id = nextId_++;
    subscriptions_[id] = Subscription{filter, handler};
    DLOG("ValuationEventBroker: subscription " << id << " added");
    return id;
}

void ValuationEventBroker::unsubscribe(QuantLib::Size id) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    if (subscriptions_.erase(id) == 0) {
        WLOG("ValuationEventBroker: subscription " << id << " not found, ignored");
    } else {
        DLOG("ValuationEventBroker: subscription " << id << " removed");
    }
}

void ValuationEventBroker::publish(const ValuationEvent& event) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    for (auto const& s : subscriptions_) {
        if (s.second.filter && !s.second.filter(event))
            continue;
        try {
            s.second.handler(event);
        } catch (const std::exception& e) {
            ALOG("ValuationEventBroker: handler of subscription " << s.first << " failed on " << event.type << " "
                                                                 << event.id << ": " << e.what());
        }
    }
}

QuantLib::Size ValuationEventBroker::subscriptions() const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return subscriptions_.size();
}

} // namespace analytics
} // namespace hre
