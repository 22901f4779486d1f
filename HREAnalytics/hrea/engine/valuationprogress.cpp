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

#include <hrea/engine/valuationprogress.hpp>

#include <hred/utilities/log.hpp>

#include <ql/errors.hpp>
#include <ql/utilities/null.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

using QuantLib::Null;
using QuantLib::Real;
using QuantLib::Size;

namespace hre {
namespace analytics {

std::ostream& operator<<(std::ostream& out, const ProgressSnapshot& s) {
    std::ios_base::fmtflags flags = out.flags();
    std::streamsize precision = out.precision();
    out << std::fixed << std::setprecision(2) << s.percent << "% complete (" << s.completed << "/" << s.total << ")";
    if (s.rate != Null<Real>())
        out << " " << s.rate << "/s";
    if (s.eta != Null<Real>())
        out << " eta " << std::setprecision(0) << s.eta << "s";
    out.flags(flags);
    out.precision(precision);
    return out;
}

namespace {
Size windowCapacity(const Size totalCost, const Real windowFraction) {
    QL_REQUIRE(windowFraction >= 0.0, "ValuationProgressTracker: window fraction (" << windowFraction
                                                                                    << ") must not be negative");
    return std::max<Size>(1, static_cast<Size>(std::floor(totalCost * windowFraction)));
}
} // namespace

ValuationProgressTracker::ValuationProgressTracker(const Size totalCost, const Real windowFraction,
                                                   const Real fallbackRate, const Clock& clock)
    : totalCost_(totalCost), fallbackRate_(fallbackRate), clock_(clock),
      window_(windowCapacity(totalCost, windowFraction)), completed_(0) {
    QL_REQUIRE(fallbackRate_ > 0.0, "ValuationProgressTracker: fallback rate (" << fallbackRate_
                                                                                << ") must be positive");
    if (!clock_)
        clock_ = []() { return boost::posix_time::microsec_clock::universal_time(); };
    DLOG("ValuationProgressTracker: total cost " << totalCost_ << ", window capacity " << window_.capacity()
                                                 << ", fallback rate " << fallbackRate_);
}

void ValuationProgressTracker::onUnitCompleted() {
    ProgressSnapshot s;
    {
        // timestamp taken under the lock, the window stays ordered in time
        std::lock_guard<std::mutex> lock(mutex_);
        window_.push_back(clock_());
        ++completed_;
        s = snapshotImpl();
    }
    report(s);
}

void ValuationProgressTracker::onUnitCompleted(const boost::posix_time::ptime& time) {
    ProgressSnapshot s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // a full ring buffer drops its oldest sample
        window_.push_back(time);
        ++completed_;
        s = snapshotImpl();
    }
    report(s);
}

void ValuationProgressTracker::report(const ProgressSnapshot& s) {
    std::ostringstream detail;
    detail << s;
    updateProgress(s.completed, s.total, detail.str());
}

ProgressSnapshot ValuationProgressTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshotImpl();
}

ProgressSnapshot ValuationProgressTracker::snapshotImpl() const {
    ProgressSnapshot s;
    s.completed = completed_;
    s.total = totalCost_;
    if (totalCost_ == 0) {
        s.percent = 100.0;
        s.rate = Null<Real>();
        s.eta = Null<Real>();
        return s;
    }
    s.percent = 100.0 * static_cast<Real>(completed_) / static_cast<Real>(totalCost_);
    s.rate = fallbackRate_;
    if (window_.size() > 1) {
        Real duration = static_cast<Real>((window_.back() - window_.front()).total_microseconds()) * 1.0E-6;
        if (duration > 0.0)
            s.rate = static_cast<Real>(window_.size() - 1) / duration;
    }
    s.eta = (static_cast<Real>(totalCost_) - static_cast<Real>(completed_)) / s.rate;
    return s;
}

Size ValuationProgressTracker::windowSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return window_.size();
}

Size ValuationProgressTracker::completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

bool ValuationProgressTracker::isUnitOfWorkCompleted(const ValuationEvent& event) {
    return event.type == ValuationEvent::Type::UnitOfWorkCompleted;
}

} // namespace analytics
} // namespace hre
