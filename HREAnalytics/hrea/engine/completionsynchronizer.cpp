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

#include <hrea/engine/completionsynchronizer.hpp>

#include <hred/utilities/log.hpp>

#include <ql/errors.hpp>

#include <algorithm>

using std::chrono::milliseconds;
using std::chrono::steady_clock;

namespace hre {
namespace analytics {

void CompletionSignal::set() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        set_ = true;
    }
    cv_.notify_all();
}

bool CompletionSignal::isSet() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return set_;
}

bool CompletionSignal::waitFor(const milliseconds& timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return set_; });
}

CompletionSynchronizer::CompletionSynchronizer(ValuationEventSource& events, const ResultStore& results,
                                               const milliseconds& pollTimeout, const milliseconds& totalBudget)
    : events_(events), results_(results), pollTimeout_(pollTimeout), totalBudget_(totalBudget), cancelled_(false),
      checks_(0) {
    QL_REQUIRE(pollTimeout_.count() > 0, "CompletionSynchronizer: poll timeout must be positive");
    QL_REQUIRE(totalBudget_.count() >= 0, "CompletionSynchronizer: total budget must not be negative");
}

ValuationResult CompletionSynchronizer::waitFor(const std::string& targetId) {
    LOG("CompletionSynchronizer: waiting for result " << targetId);

    auto signal = QuantLib::ext::make_shared<CompletionSignal>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        currentSignal_ = signal;
    }

    ScopedSubscription subscription(
        events_,
        [targetId](const ValuationEvent& e) {
            return e.type == ValuationEvent::Type::ResultCreated && e.id == targetId;
        },
        [signal, targetId](const ValuationEvent&) {
            DLOG("CompletionSynchronizer: result " << targetId << " created");
            signal->set();
        });

    auto start = steady_clock::now();
    bool signalled = false;
    checks_ = 0;

    for (;;) {
        ++checks_;
        if (results_.has(targetId)) {
            LOG("CompletionSynchronizer: result " << targetId << " found after " << checks_ << " checks");
            return results_.get(targetId);
        }

        QL_REQUIRE(!cancelled(), "valuation " << targetId << " did not complete: wait was cancelled");

        milliseconds wait = pollTimeout_;
        if (totalBudget_.count() > 0) {
            auto elapsed = std::chrono::duration_cast<milliseconds>(steady_clock::now() - start);
            QL_REQUIRE(elapsed < totalBudget_, "valuation " << targetId << " did not complete within "
                                                            << totalBudget_.count() << "ms");
            wait = std::min(wait, totalBudget_ - elapsed);
        }

        if (!signalled) {
            signalled = signal->waitFor(wait);
            if (!signalled)
                DLOG("CompletionSynchronizer: no completion of " << targetId << " after " << wait.count()
                                                                 << "ms, checking result store");
        } else {
            // the signal stays set, wait on the cancellation condition instead
            WLOG("CompletionSynchronizer: completion of " << targetId << " signalled but result not in store");
            sleepFor(wait);
        }
    }
}

bool CompletionSynchronizer::sleepFor(const milliseconds& duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cancelCv_.wait_for(lock, duration, [this]() { return cancelled_; });
}

void CompletionSynchronizer::cancel() {
    QuantLib::ext::shared_ptr<CompletionSignal> signal;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        signal = currentSignal_;
    }
    LOG("CompletionSynchronizer: cancelled");
    cancelCv_.notify_all();
    if (signal)
        signal->set();
}

bool CompletionSynchronizer::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

} // namespace analytics
} // namespace hre
