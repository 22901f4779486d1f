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

/*! \file hred/utilities/progressbar.hpp
    \brief Classes for progress reporting
    \ingroup utilities
*/

#pragma once

#include <hred/utilities/log.hpp>

#include <ql/shared_ptr.hpp>

#include <iostream>
#include <mutex>
#include <set>
#include <string>

namespace hre {
namespace data {

//! Abstract Base class for a Progress Indicator
/*! \ingroup utilities
 */
class ProgressIndicator {
public:
    ProgressIndicator() {}
    virtual ~ProgressIndicator() {}
    virtual void updateProgress(const unsigned long progress, const unsigned long total,
                                const std::string& detail = "") = 0;
    virtual void reset() = 0;
};

//! Base class for a Progress Reporter
/*! A ProgressReporter forwards each progress update to all registered indicators.
    \ingroup utilities
 */
class ProgressReporter {
public:
    ProgressReporter() {}
    virtual ~ProgressReporter() {}
    //! register a Progress Indicator
    void registerProgressIndicator(const QuantLib::ext::shared_ptr<ProgressIndicator>& indicator);
    //! unregister a Progress Indicator
    void unregisterProgressIndicator(const QuantLib::ext::shared_ptr<ProgressIndicator>& indicator);
    //! unregister all Progress Indicators
    void unregisterAllProgressIndicators();
    //! update progress
    void updateProgress(const unsigned long progress, const unsigned long total, const std::string& detail = "");
    //! reset
    void resetProgress();
    //! get indicators
    std::set<QuantLib::ext::shared_ptr<ProgressIndicator>> progressIndicators() const;

private:
    std::set<QuantLib::ext::shared_ptr<ProgressIndicator>> indicators_;
    mutable std::mutex mutex_;
};

//! Simple Progress Bar
/*! Writes a simple progress bar to the given stream, the detail string is shown next to the bar.
    A new line is started once the progress reaches the total.
    \ingroup utilities
 */
class SimpleProgressBar : public ProgressIndicator {
public:
    SimpleProgressBar(const std::string& message, const unsigned int messageWidth = 40, const unsigned int barWidth = 40,
                      const unsigned int numberOfScreenUpdates = 100, std::ostream& out = std::cout);

    /*! if enabled is false, no output is produced */
    void updateProgress(const unsigned long progress, const unsigned long total,
                        const std::string& detail = "") override;
    void reset() override;

    //! enable / disable the bar
    void setEnabled(const bool enabled) { enabled_ = enabled; }

private:
    std::string message_;
    unsigned int messageWidth_, barWidth_, numberOfScreenUpdates_;
    std::ostream& out_;
    unsigned int updateCounter_;
    bool finalized_, enabled_;
    std::mutex mutex_;
};

//! Progress Logger that writes the progress using the HRE logger
/*! \ingroup utilities
 */
class ProgressLog : public ProgressIndicator {
public:
    ProgressLog(const std::string& message, const unsigned int numberOfMessages = 100,
                const unsigned int logLevel = HRE_NOTICE);
    void updateProgress(const unsigned long progress, const unsigned long total,
                        const std::string& detail = "") override;
    void reset() override;

private:
    std::string message_;
    unsigned int numberOfMessages_;
    unsigned int logLevel_;
    unsigned int messageCounter_;
    std::mutex mutex_;
};

} // namespace data
} // namespace hre
