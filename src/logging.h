// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QFUND_LOGGING_H
#define QFUND_LOGGING_H

#include <boost/format.hpp>

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>

static const bool DEFAULT_LOGTIMESTAMPS = true;

namespace BCLog {

enum LogFlags : uint32_t {
    NONE    = 0,
    QF      = (1 << 0),   // matching engine (scores, scaling, leftover)
    ROUND   = (1 << 1),   // round orchestration (proposals, votes, distribution)
    RPC     = (1 << 2),   // JSON boundary and cli
    ALL     = ~(uint32_t)0,
};

class Logger
{
private:
    mutable std::mutex m_cs;
    FILE* m_fileout = nullptr;

    /** Log categories bitfield. */
    std::atomic<uint32_t> m_categories{0};

    /**
     * m_started_new_line is a state variable that will suppress printing of
     * the timestamp when multiple calls are made that don't end in a
     * newline.
     */
    bool m_started_new_line = true;

    std::string LogTimestampStr(const std::string& str);

public:
    bool m_print_to_console = false;
    bool m_print_to_file = false;
    bool m_log_timestamps = DEFAULT_LOGTIMESTAMPS;

    std::string m_file_path;

    ~Logger();

    /** Send a string to the log output */
    void LogPrintStr(const std::string& str);

    /** Returns whether logs will be written to any output */
    bool Enabled() const { return m_print_to_console || m_print_to_file; }

    /** Open m_file_path in append mode. Returns false if it cannot be opened. */
    bool OpenDebugLog();

    /** Close the log file and stop writing to it. */
    void ShrinkDebugFile();

    void EnableCategory(LogFlags flag);
    bool EnableCategory(const std::string& str);
    void DisableCategory(LogFlags flag);
    bool DisableCategory(const std::string& str);

    uint32_t GetCategoryMask() const { return m_categories.load(); }

    bool WillLogCategory(LogFlags category) const;
};

} // namespace BCLog

BCLog::Logger& LogInstance();

/** Return true if log accepts specified category */
static inline bool LogAcceptCategory(BCLog::LogFlags category)
{
    return LogInstance().WillLogCategory(category);
}

/** Returns a string with the log categories. */
std::string ListLogCategories();

/** Return true if str parses as a log category and set the flag */
bool GetLogCategory(BCLog::LogFlags& flag, const std::string& str);

namespace qflog {

inline void FeedFormat(boost::format&) {}

template <typename T, typename... Args>
void FeedFormat(boost::format& fmt, const T& arg, const Args&... args)
{
    fmt % arg;
    FeedFormat(fmt, args...);
}

/**
 * printf-style formatting through boost::format.
 * Length modifiers (l, ll, z) are accepted and ignored: every argument is
 * rendered through its operator<<, which is what makes CAmount printable.
 */
template <typename... Args>
std::string FormatMessage(const char* fmt, const Args&... args)
{
    boost::format f(fmt);
    FeedFormat(f, args...);
    return f.str();
}

} // namespace qflog

// Be conservative when using LogPrintf/error or other things which
// unconditionally log to debug.log! It should not be the case that an inbound
// request can fill up a user's disk.
template <typename... Args>
static inline void LogPrintf(const char* fmt, const Args&... args)
{
    if (LogInstance().Enabled()) {
        std::string log_msg;
        try {
            log_msg = qflog::FormatMessage(fmt, args...);
        } catch (const boost::io::format_error& fmterr) {
            /* Original format string will have newline so don't add one here */
            log_msg = "Error \"" + std::string(fmterr.what()) + "\" while formatting log message: " + fmt;
        }
        LogInstance().LogPrintStr(log_msg);
    }
}

#define LogPrint(category, ...)              \
    do {                                     \
        if (LogAcceptCategory((category))) { \
            LogPrintf(__VA_ARGS__);          \
        }                                    \
    } while (0)

template <typename... Args>
bool error(const char* fmt, const Args&... args)
{
    LogPrintf((std::string("ERROR: ") + fmt + "\n").c_str(), args...);
    return false;
}

#endif // QFUND_LOGGING_H
