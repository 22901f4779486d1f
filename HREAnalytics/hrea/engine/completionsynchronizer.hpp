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

/*! \file hrea/engine/completionsynchronizer.hpp
    \brief Blocking wait for the result of an asynchronous valuation
    \ingroup engine
*/

#pragma once

#include <hrea/valuation/resultstore.hpp>
#include <hrea/valuation/valuationevents.hpp>

#include <ql/shared_ptr.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace hre {
namespace analytics {

//! One shot readiness flag
/*! Once set the signal stays set. set() may be called from any thread and any number of times.
    \ingroup engine
 */
class CompletionSignal {
public:
    CompletionSignal() : set_(false) {}

    void set();
    bool isSet() const;
    //! blocks until the signal is set or the timeout expires, returns isSet()
    bool waitFor(const std::chrono::milliseconds& timeout);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool set_;
};

//! Waits for the result of a valuation to appear in the result store
/*! waitFor() subscribes to \c ResultCreated events carrying the target id, a matching event sets a
    CompletionSignal. The calling thread checks the result store, and if the result is not there yet
    blocks on the signal for at most the poll timeout before checking again. The result store is the
    authoritative source, the signal only wakes the waiter early.

    The wait fails if the total budget (if positive) is exhausted or if cancel() is called. The subscription is
    released on every exit of waitFor().
    \ingroup engine
 */
class CompletionSynchronizer {
public:
    /*! \param events      notification source of the valuation engine
        \param results     result store of the valuation engine
        \param pollTimeout maximum time between two checks of the result store
        \param totalBudget maximum total waiting time, zero means no limit
    */
    CompletionSynchronizer(ValuationEventSource& events, const ResultStore& results,
                           const std::chrono::milliseconds& pollTimeout = std::chrono::milliseconds(2000),
                           const std::chrono::milliseconds& totalBudget = std::chrono::milliseconds::zero());

    //! blocks until the result with the given id is in the result store and returns it
    ValuationResult waitFor(const std::string& targetId);

    //! abort the current and all subsequent waits, can be called from any thread
    void cancel();
    bool cancelled() const;

    //! number of result store checks during the last call to waitFor()
    QuantLib::Size checks() const { return checks_; }

private:
    //! waits on the cancellation condition, returns true if cancelled
    bool sleepFor(const std::chrono::milliseconds& duration);

    ValuationEventSource& events_;
    const ResultStore& results_;
    const std::chrono::milliseconds pollTimeout_, totalBudget_;

    mutable std::mutex mutex_;
    std::condition_variable cancelCv_;
    bool cancelled_;
    QuantLib::ext::shared_ptr<CompletionSignal> currentSignal_;
    std::atomic<QuantLib::Size> checks_;
};

} // namespace analytics
} // namespace hre
