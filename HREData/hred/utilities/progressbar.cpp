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

#include <hred/utilities/progressbar.hpp>

#include <iomanip>

namespace hre {
namespace data {

void ProgressReporter::registerProgressIndicator(const QuantLib::ext::shared_ptr<ProgressIndicator>& indicator) {
    std::lock_guard<std::mutex> lock(mutex_);
    indicators_.insert(indicator);
}

void ProgressReporter::unregisterProgressIndicator(const QuantLib::ext::shared_ptr<ProgressIndicator>& indicator) {
    std::lock_guard<std::mutex> lock(mutex_);
    indicators_.erase(indicator);
}

void ProgressReporter::unregisterAllProgressIndicators() {
    std::lock_guard<std::mutex> lock(mutex_);
    indicators_.clear();
}

void ProgressReporter::updateProgress(const unsigned long progress, const unsigned long total,
                                      const std::string& detail) {
    for (auto const& i : progressIndicators())
        i->updateProgress(progress, total, detail);
}

void ProgressReporter::resetProgress() {
    for (auto const& i : progressIndicators())
        i->reset();
}

std::set<QuantLib::ext::shared_ptr<ProgressIndicator>> ProgressReporter::progressIndicators() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return indicators_;
}

SimpleProgressBar::SimpleProgressBar(const std::string& message, const unsigned int messageWidth,
                                     const unsigned int barWidth, const unsigned int numberOfScreenUpdates,
                                     std::ostream& out)
    : message_(message), messageWidth_(messageWidth), barWidth_(barWidth),
      numberOfScreenUpdates_(numberOfScreenUpdates), out_(out), updateCounter_(0), finalized_(false),
      enabled_(true) {}

void SimpleProgressBar::updateProgress(const unsigned long progress, const unsigned long total,
                                       const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_ || finalized_)
        return;
    if (progress >= total) {
        out_ << "\r" << std::setw(messageWidth_) << std::left << message_;
        out_ << "[" << std::string(barWidth_, '=') << "] 100 %  " << detail << std::endl;
        finalized_ = true;
        return;
    }
    if (progress < updateCounter_ * static_cast<double>(total) / numberOfScreenUpdates_)
        return;
    double ratio = static_cast<double>(progress) / static_cast<double>(total);
    unsigned int pos = static_cast<unsigned int>(barWidth_ * ratio);
    out_ << "\r" << std::setw(messageWidth_) << std::left << message_ << "[";
    for (unsigned int i = 0; i < barWidth_; ++i) {
        if (i < pos)
            out_ << "=";
        else if (i == pos)
            out_ << ">";
        else
            out_ << " ";
    }
    out_ << "] " << std::setw(3) << std::right << static_cast<int>(ratio * 100.0) << " %  " << detail;
    out_.flush();
    ++updateCounter_;
}

void SimpleProgressBar::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    updateCounter_ = 0;
    finalized_ = false;
}

ProgressLog::ProgressLog(const std::string& message, const unsigned int numberOfMessages, const unsigned int logLevel)
    : message_(message), numberOfMessages_(numberOfMessages), logLevel_(logLevel), messageCounter_(0) {}

void ProgressLog::updateProgress(const unsigned long progress, const unsigned long total, const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (progress < total && progress < messageCounter_ * static_cast<double>(total) / numberOfMessages_)
        return;
    if (messageCounter_ > numberOfMessages_)
        return;
    MLOG(logLevel_, message_ << " " << progress << " out of " << total << " steps (" << std::fixed
                             << std::setprecision(2) << (total == 0 ? 100.0 : 100.0 * progress / total)
                             << "%) completed" << (detail.empty() ? "" : ": ") << detail);
    ++messageCounter_;
}

void ProgressLog::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    messageCounter_ = 0;
}

} // namespace data
} // namespace hre
