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

/*! \file hrea/valuation/valuationevents.hpp
    \brief Notifications emitted by a running contract valuation
    \ingroup valuation
*/

#pragma once

#include <ql/types.hpp>

#include <boost/noncopyable.hpp>
#include <boost/thread/shared_mutex.hpp>

#include <functional>
#include <map>
#include <ostream>
#include <string>

namespace hre {
namespace analytics {

//! Notification emitted by a valuation
/*! \ingroup valuation
 */
struct ValuationEvent {
    enum class Type {
        UnitOfWorkCompleted, //!< one node value of the valuation is computed
        ResultCreated        //!< the final result \c id is stored in the result store
    };

    ValuationEvent(Type type, const std::string& id = "") : type(type), id(id) {}

    Type type;
    std::string id;
};

std::ostream& operator<<(std::ostream& out, const ValuationEvent::Type& type);

//! Source of valuation notifications
/*! Handlers are called on the publishing thread, which is in general not the thread that subscribed. A handler
    is only called for events accepted by its filter.

    \warning handlers must not subscribe to or unsubscribe from the source they are called by.
    \ingroup valuation
 */
class ValuationEventSource {
public:
    typedef std::function<bool(const ValuationEvent&)> Filter;
    typedef std::function<void(const ValuationEvent&)> Handler;

    virtual ~ValuationEventSource() {}

    //! registers a handler, returns the subscription id
    virtual QuantLib::Size subscribe(const Filter& filter, const Handler& handler) = 0;
    /*! removes the subscription, once this returns the handler is not running and will not be called again,
        unknown ids are ignored */
    virtual void unsubscribe(QuantLib::Size id) = 0;
};

//! Subscription to a ValuationEventSource that is released when the object goes out of scope
/*! \ingroup valuation
 */
class ScopedSubscription : private boost::noncopyable {
public:
    ScopedSubscription(ValuationEventSource& source, const ValuationEventSource::Filter& filter,
                       const ValuationEventSource::Handler& handler);
    ~ScopedSubscription();

    //! unsubscribe before the end of the scope, subsequent calls do nothing
    void release();
    bool active() const { return active_; }
    QuantLib::Size id() const { return id_; }

private:
    ValuationEventSource& source_;
    QuantLib::Size id_;
    bool active_;
};

//! Thread safe publish / subscribe implementation of ValuationEventSource
/*! Several threads can publish at the same time, dispatch happens under a shared lock. Subscribing and
    unsubscribing take the unique lock and therefore wait for running dispatches to finish.

    An exception thrown by a handler is logged and does not prevent the dispatch to the remaining handlers.
    \ingroup valuation
 */
class ValuationEventBroker : public ValuationEventSource {
public:
    ValuationEventBroker() : nextId_(0) {}

    QuantLib::Size subscribe(const Filter& filter, const Handler& handler) override;
    void unsubscribe(QuantLib::Size id) override;

    //! dispatch the event to all subscribers whose filter accepts it
    void publish(const ValuationEvent& event) const;

    //! number of active subscriptions
    QuantLib::Size subscriptions() const;

private:
    struct Subscription {
        Filter filter;
        Handler handler;
    };
    std::map<QuantLib::Size, Subscription> subscriptions_;
    QuantLib::Size nextId_;
    mutable boost::shared_mutex mutex_;
};

} // namespace analytics
} // namespace hre
