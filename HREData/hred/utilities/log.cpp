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

#include <hred/utilities/log.hpp>

#include <ql/errors.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/thread/lock_types.hpp>

#include <iomanip>
#include <thread>

using namespace boost::posix_time;
using std::string;

namespace hre {
namespace data {

const string StderrLogger::name = "StderrLogger";
const string BufferLogger::name = "BufferLogger";
const string FileLogger::name = "FileLogger";

// -- File Logger

FileLogger::FileLogger(const string& filename) : Logger(name), filename_(filename) {
    fout_.open(filename.c_str(), std::ios_base::out);
    QL_REQUIRE(fout_.is_open(), "Error opening file " << filename);
    fout_.setf(std::ios::fixed, std::ios::floatfield);
    fout_.setf(std::ios::showpoint);
}

FileLogger::~FileLogger() {
    if (fout_.is_open())
        fout_.close();
}

void FileLogger::log(unsigned, const string& msg) {
    if (fout_.is_open())
        fout_ << msg << std::endl;
}

// -- Buffer Logger

void BufferLogger::log(unsigned level, const string& msg) {
    if (level <= minLevel_)
        buffer_.push(msg);
}

bool BufferLogger::hasNext() { return !buffer_.empty(); }

string BufferLogger::next() {
    QL_REQUIRE(!buffer_.empty(), "Log Buffer is empty");
    string msg = buffer_.front();
    buffer_.pop();
    return msg;
}

// -- Log

Log::Log() : loggers_(), enabled_(false), mask_(255) {}

void Log::registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    QL_REQUIRE(loggers_.find(logger->name()) == loggers_.end(),
               "Logger with name " << logger->name() << " already registered");
    loggers_[logger->name()] = logger;
}

bool Log::hasLogger(const string& name) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return loggers_.find(name) != loggers_.end();
}

QuantLib::ext::shared_ptr<Logger>& Log::logger(const string& name) {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    auto it = loggers_.find(name);
    QL_REQUIRE(it != loggers_.end(), "No logger found with name " << name);
    return it->second;
}

void Log::removeLogger(const string& name) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    auto it = loggers_.find(name);
    QL_REQUIRE(it != loggers_.end(), "No logger found with name " << name);
    loggers_.erase(it);
}

void Log::removeAllLoggers() {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    loggers_.clear();
}

string Log::source(const char* filename, int lineNo) const {
    string filepath;
    if (rootPath_.empty()) {
        filepath = filename;
    } else {
        filepath = boost::filesystem::path(filename).lexically_relative(rootPath_).string();
        if (filepath.empty() || filepath.compare(0, 2, "..") == 0)
            filepath = filename;
    }
    int lineNoLen = 0;
    for (int i = lineNo; i > 0; i /= 10)
        lineNoLen++;
    std::ostringstream s;
    s << "(" << filepath << ':' << lineNo << ')' << std::setw(6 - lineNoLen) << ' ';
    return s.str();
}

void Log::log(unsigned mask, const char* filename, int lineNo, const string& msg) {
    std::ostringstream header;
    header << to_simple_string(microsec_clock::local_time()) << " " << std::setw(8) << std::left;
    switch (mask) {
    case HRE_ALERT:
        header << "ALERT";
        break;
    case HRE_CRITICAL:
        header << "CRITICAL";
        break;
    case HRE_ERROR:
        header << "ERROR";
        break;
    case HRE_WARNING:
        header << "WARNING";
        break;
    case HRE_NOTICE:
        header << "NOTICE";
        break;
    case HRE_DEBUG:
        header << "DEBUG";
        break;
    case HRE_DATA:
        header << "DATA";
        break;
    case HRE_MEMORY:
        header << "MEMORY";
        break;
    default:
        header << "UNKNOWN";
        break;
    }
    header << " [" << std::this_thread::get_id() << "] " << source(filename, lineNo);

    string text = header.str() + msg;

    // loggers are called under the unique lock, a logger does not need to be thread safe itself
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    for (auto& l : loggers_)
        l.second->log(mask, text);
}

// -- Structured messages

StructuredMessage::StructuredMessage(const Category& category, const Group& group, const string& message,
                                     const std::map<string, string>& subFields)
    : category_(category), group_(group), message_(message), subFields_(subFields) {}

namespace {
string jsonEscape(const string& s) {
    string r;
    for (auto c : s) {
        if (c == '"' || c == '\\')
            r += '\\';
        if (c == '\n') {
            r += "\\n";
            continue;
        }
        r += c;
    }
    return r;
}
} // namespace

string StructuredMessage::msg() const {
    std::ostringstream out;
    out << "{ \"category\": \"" << category_ << "\", \"group\": \"" << group_ << "\", \"message\": \""
        << jsonEscape(message_) << "\"";
    if (!subFields_.empty()) {
        out << ", \"sub_fields\": [ ";
        bool first = true;
        for (const auto& f : subFields_) {
            if (!first)
                out << ", ";
            out << "{ \"name\": \"" << jsonEscape(f.first) << "\", \"value\": \"" << jsonEscape(f.second) << "\" }";
            first = false;
        }
        out << " ]";
    }
    out << " }";
    return out.str();
}

void StructuredMessage::log() const {
    if (category_ == Category::Error) {
        ALOG("StructuredErrorMessage " << msg());
    } else if (category_ == Category::Warning) {
        WLOG("StructuredWarningMessage " << msg());
    } else {
        LOG("StructuredMessage " << msg());
    }
}

std::ostream& operator<<(std::ostream& out, const StructuredMessage::Category& category) {
    switch (category) {
    case StructuredMessage::Category::Error:
        return out << "Error";
    case StructuredMessage::Category::Warning:
        return out << "Warning";
    default:
        return out << "UnknownType";
    }
}

std::ostream& operator<<(std::ostream& out, const StructuredMessage::Group& group) {
    switch (group) {
    case StructuredMessage::Group::Analytics:
        return out << "Analytics";
    case StructuredMessage::Group::Configuration:
        return out << "Configuration";
    case StructuredMessage::Group::Valuation:
        return out << "Valuation";
    default:
        return out << "UnknownType";
    }
}

} // namespace data
} // namespace hre
