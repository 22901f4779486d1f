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

/*! \file hrea/engine/valuationprogress.hpp
    \brief Progress, rate and ETA of a running valuation
    \ingroup engine
*/

#pragma once

#include <hrea/valuation/valuationevents.hpp>

#include <hred/utilities/progressbar.hpp>

#include <ql/types.hpp>

#include <boost/circular_buffer.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <functional>
#include <mutex>
#include <ostream>

namespace hre {
namespace analytics {

//! Progress of a valuation at one point in time
struct ProgressSnapshot {
    QuantLib::Size completed;
    QuantLib::Size total;
    //! 100 * completed / total, 100 if total is zero
    QuantLib::Real percent;
    //! units of work per second, Null<Real>() if total is zero
    QuantLib::Real rate;
    //! estimated seconds to completion, Null<Real>() if total is zero
    QuantLib::Real eta;
};

//! prints e.g. "50.00% complete (50/100) 1.00/s eta 50s"
std::ostream& operator<<(std::ostream& out, const ProgressSnapshot& snapshot);

//! Tracks the completed units of work of a valuation and estimates rate and time to completion
/*! The timestamps of the most recent completions are kept in a ring buffer with capacity
    \f$ \max(1, \lfloor \mathrm{totalCost} \cdot \mathrm{windowFraction} \rfloor) \f$. With \f$ n \geq 2 \f$
    timestamps spanning a positive interval \f$ \Delta t \f$ the rate is \f$ (n-1)/\Delta t \f$, otherwise the
    fallback rate is used. The ETA is the number of outstanding units divided by the rate.

    onUnitCompleted() can be called concurrently from several producer threads. Each call forwards the progress
    to the registered progress indicators.
    \ingroup engine
 */
class ValuationProgressTracker : public hre::data::ProgressReporter {
public:
    typedef std::function<boost::posix_time::ptime()> Clock;

    /*! \param totalCost      number of units of work of the valuation (sum of the call costs)
        \param windowFraction size of the rate window relative to the total cost
        \param fallbackRate   rate used while the window holds less than two samples
        \param clock          time source, defaults to the microsecond utc clock
    */
    explicit ValuationProgressTracker(const QuantLib::Size totalCost, const QuantLib::Real windowFraction = 0.5,
                                      const QuantLib::Real fallbackRate = 0.001, const Clock& clock = Clock());

    //! record one completed unit of work at the current time
    void onUnitCompleted();
    //! record one completed unit of work at the given time
    void onUnitCompleted(const boost::posix_time::ptime& time);

    ProgressSnapshot snapshot() const;

    QuantLib::Size totalCost() const { return totalCost_; }
    QuantLib::Size windowCapacity() const { return window_.capacity(); }
    QuantLib::Size windowSize() const;
    QuantLib::Size completed() const;

    //! filter accepting unit of work notifications
    static bool isUnitOfWorkCompleted(const ValuationEvent& event);

private:
    ProgressSnapshot snapshotImpl() const;
    void report(const ProgressSnapshot& s);

    const QuantLib::Size totalCost_;
    const QuantLib::Real fallbackRate_;
    Clock clock_;
    boost::circular_buffer<boost::posix_time::ptime> window_;
    QuantLib::Size completed_;
    mutable std::mutex mutex_;
};

} // namespace analytics
} // namespace hre
