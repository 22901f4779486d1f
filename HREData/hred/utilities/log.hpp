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

/*! \file hred/utilities/log.hpp
    \brief Classes and functions for log message handling.
    \ingroup utilities
*/

#pragma once

// accumulated 'filter' for 'external' DEBUG_MASK
#define HRE_ALERT 1    // 00000001   1 = 2^0
#define HRE_CRITICAL 2 // 00000010   2 = 2^1
#define HRE_ERROR 4    // 00000100   4 = 2^2
#define HRE_WARNING 8  // 00001000   8 = 2^3
#define HRE_NOTICE 16  // 00010000  16 = 2^4
#define HRE_DEBUG 32   // 00100000  32 = 2^5
#define HRE_DATA 64    // 01000000  64 = 2^6
#define HRE_MEMORY 128 // 10000000 128 = 2^7

#include <atomic>
#include <fstream>
#include <iostream>
#include <map>
#include <queue>
#include <sstream>
#include <string>

#include <ql/patterns/singleton.hpp>
#include <ql/shared_ptr.hpp>

#include <boost/filesystem/path.hpp>
#include <boost/thread/shared_mutex.hpp>

namespace hre {
namespace data {

//! The Base Custom Log Handler class
/*!
  This base log handler class can be used to define your own custom handler and then registered with the Log class.
  Once registered it will receive all log messages as soon as they occur via it's log() method
  \ingroup utilities
  \see Log
 */
class Logger {
public:
    //! Destructor
    virtual ~Logger() {}

    //! The Log call back function
    /*!
      This function will be called every time a log message is produced.
      \param level the log level
      \param s the log message
     */
    virtual void log(unsigned level, const std::string& s) = 0;

    //! Returns the Logger name
    const std::string& name() { return name_; }

protected:
    //! Constructor
    /*!
      Implementations must provide a logger name
      \param name the logger name
     */
    Logger(const std::string& name) : name_(name) {}

private:
    std::string name_;
};

//! Stderr Logger
/*!
  This logger writes each log message out to stderr (std::cerr)
  \ingroup utilities
  \see Log
 */
class StderrLogger : public Logger {
public:
    //! the name "StderrLogger"
    static const std::string name;
    //! Constructor
    /*!
      This logger writes all logs to stderr.
      If alertOnly is set to true, it will only write alerts.
     */
    StderrLogger(bool alertOnly = false) : Logger(name), alertOnly_(alertOnly) {}
    //! Destructor
    virtual ~StderrLogger() {}
    //! The log callback that writes to stderr
    virtual void log(unsigned l, const std::string& s) override {
        if (!alertOnly_ || l <= HRE_CRITICAL)
            std::cerr << s << std::endl;
    }

private:
    bool alertOnly_;
};

//! FileLogger
/*!
  This logger writes each log message out to the given file.
  The file is flushed, but not closed, after each log message.
  \ingroup utilities
  \see Log
 */
class FileLogger : public Logger {
public:
    //! the name "FileLogger"
    static const std::string name;
    //! Constructor
    /*!
      Construct a file logger using the given filename, this filename is passed to std::fostream::open()
      and this constructor will throw an exception if the file is not opened (e.g. if the filename is invalid)
      \param filename the log filename
     */
    FileLogger(const std::string& filename);
    //! Destructor
    virtual ~FileLogger();
    //! The log callback
    virtual void log(unsigned, const std::string&) override;

private:
    std::string filename_;
    std::fstream fout_;
};

//! BufferLogger
/*!
  This logger stores each log message in an internal buffer, it can then be probed for log messages at a later point.
  Log messages are always returned in FIFO order.

  Typical usage to display log messages would be
  <pre>
      while (bLogger.hasNext()) {
          MsgBox("Log Message", bLogger.next());
      }
  </pre>
  \ingroup utilities
  \see Log
 */
class BufferLogger : public Logger {
public:
    //! the name "BufferLogger"
    static const std::string name;
    //! Constructor
    BufferLogger(unsigned minLevel = HRE_DATA) : Logger(name), minLevel_(minLevel) {}
    //! Destructor
    virtual ~BufferLogger() {}
    //! The log callback
    virtual void log(unsigned, const std::string&) override;

    //! Checks if Logger has new messages
    /*!
      \return True if this BufferLogger has any new log messages
     */
    bool hasNext();
    //! Retrieve new messages
    /*!
      Retrieve the next new message from the buffer, this will throw if the buffer is empty.
      Messages are returned in a FIFO order. Messages are deleted from the buffer once returned.
      \return The next message
     */
    std::string next();

private:
    std::queue<std::string> buffer_;
    unsigned minLevel_;
};

//! Global static Log class
/*!
  The Global Log class gets registered with individual loggers and receives application log messages.
  Once a message is received, it is immediately dispatched to each of the registered loggers, the order in which
  the loggers are called is not guaranteed.

  Logging is done by the calling thread and the LOG call blocks until all the loggers have returned.

  At start up, the Log class has no loggers and so will ignore any LOG() messages until it is configured.

  To configure the Log class to log to a file "/tmp/hre.log":
  <pre>
      Log::instance().registerLogger(QuantLib::ext::make_shared<FileLogger>("/tmp/hre.log"));
  </pre>

  To change the Log configuration to log to stderr:
  <pre>
      Log::instance().removeAllLoggers();
      Log::instance().registerLogger(QuantLib::ext::make_shared<StderrLogger>());
  </pre>

  \ingroup utilities
 */
class Log : public QuantLib::Singleton<Log, std::integral_constant<bool, true>> {

    friend class QuantLib::Singleton<Log, std::integral_constant<bool, true>>;

public:
    //! Add a new Logger.
    /*! Adding a new logger will throw if a logger with the same name is already registered
     */
    void registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger);
    //! Check if logger exists
    bool hasLogger(const std::string& name) const;
    //! Retrieve a Logger.
    /*! Retrieve a Logger by its name, throws if no such logger exists
     */
    QuantLib::ext::shared_ptr<Logger>& logger(const std::string& name);
    //! Remove a Logger
    /*! Remove a logger by name, throws if no such logger exists
     */
    void removeLogger(const std::string& name);
    //! Remove all loggers
    void removeAllLoggers();

    //! macro utility function - do not use directly
    void log(unsigned mask, const char* filename, int lineNo, const std::string& msg);

    //! mask
    unsigned mask() { return mask_; }
    //! set mask
    void setMask(unsigned mask) { mask_ = mask; }

    //! root path used to shorten file names in the log header
    const boost::filesystem::path& rootPath() { return rootPath_; }
    void setRootPath(const boost::filesystem::path& pth) { rootPath_ = pth; }

    //! check if Log is enabled
    bool enabled() { return enabled_; }
    //! enable Log
    void switchOn() { enabled_ = true; }
    //! disable Log
    void switchOff() { enabled_ = false; }

    //! check whether a message of the given level passes the current mask
    bool filter(unsigned mask) { return (mask & mask_) != 0; }

private:
    Log();

    std::string source(const char* filename, int lineNo) const;

    std::map<std::string, QuantLib::ext::shared_ptr<Logger>> loggers_;
    std::atomic<bool> enabled_;
    std::atomic<unsigned> mask_;
    boost::filesystem::path rootPath_;
    mutable boost::shared_mutex mutex_;
};

/*!
  Main Logging macro, do not use this directly, use one of the below 8 macros instead
 */
#define MLOG(mask, text)                                                                                               \
    {                                                                                                                  \
        if (hre::data::Log::instance().enabled() && hre::data::Log::instance().filter(mask)) {                         \
            std::ostringstream __hre_mlog_tmp_stringstream;                                                            \
            __hre_mlog_tmp_stringstream << text;                                                                       \
            hre::data::Log::instance().log(mask, __FILE__, __LINE__, __hre_mlog_tmp_stringstream.str());               \
        }                                                                                                              \
    }

//! Logging Macro (Level = Alert)
#define ALOG(text) MLOG(HRE_ALERT, text);
//! Logging Macro (Level = Critical)
#define CLOG(text) MLOG(HRE_CRITICAL, text);
//! Logging Macro (Level = Error)
#define ELOG(text) MLOG(HRE_ERROR, text);
//! Logging Macro (Level = Warning)
#define WLOG(text) MLOG(HRE_WARNING, text);
//! Logging Macro (Level = Notice)
#define LOG(text) MLOG(HRE_NOTICE, text);
//! Logging Macro (Level = Debug)
#define DLOG(text) MLOG(HRE_DEBUG, text);
//! Logging Macro (Level = Data)
#define TLOG(text) MLOG(HRE_DATA, text);

//! Utility class for having structured messages in the log
/*!
  A structured message is a category (error, warning, ...), a group (the part of the system that raised it),
  a free text message and a map of sub fields. It is written to the log as a single line of the form
  <pre>
      StructuredErrorMessage { "category": "error", "group": "Analytics", "message": "...", "sub_fields": [...] }
  </pre>
  \ingroup utilities
 */
class StructuredMessage {
public:
    enum class Category { Error, Warning, Unknown };

    enum class Group { Analytics, Configuration, Valuation, Unknown };

    StructuredMessage(const Category& category, const Group& group, const std::string& message,
                      const std::map<std::string, std::string>& subFields = std::map<std::string, std::string>());

    virtual ~StructuredMessage() {}

    //! the message as a single json-like line
    std::string msg() const;

    //! write the message to the log, errors at level alert, warnings at level warning
    void log() const;

    const Category& category() const { return category_; }
    const Group& group() const { return group_; }
    const std::string& message() const { return message_; }
    const std::map<std::string, std::string>& subFields() const { return subFields_; }

protected:
    Category category_;
    Group group_;
    std::string message_;
    std::map<std::string, std::string> subFields_;
};

std::ostream& operator<<(std::ostream& out, const StructuredMessage::Category&);

std::ostream& operator<<(std::ostream& out, const StructuredMessage::Group&);

//! Utility to write a structured message to the log
#define ALOG_STRUCTURED(category, group, text)                                                                         \
    {                                                                                                                  \
        std::ostringstream __hre_structured_tmp_stringstream;                                                          \
        __hre_structured_tmp_stringstream << text;                                                                     \
        hre::data::StructuredMessage(category, group, __hre_structured_tmp_stringstream.str()).log();                  \
    }

} // namespace data
} // namespace hre
