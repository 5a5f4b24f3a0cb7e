// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logging.h"

#include <chrono>
#include <ctime>

BCLog::Logger& LogInstance()
{
    // Leaked on purpose: log calls may happen during static destruction.
    static BCLog::Logger* g_logger{new BCLog::Logger()};
    return *g_logger;
}

struct CLogCategoryDesc
{
    BCLog::LogFlags flag;
    std::string category;
};

static const CLogCategoryDesc LogCategories[] =
{
    {BCLog::NONE, "0"},
    {BCLog::NONE, "none"},
    {BCLog::QF, "qf"},
    {BCLog::ROUND, "round"},
    {BCLog::RPC, "rpc"},
    {BCLog::ALL, "1"},
    {BCLog::ALL, "all"},
};

bool GetLogCategory(BCLog::LogFlags& flag, const std::string& str)
{
    if (str.empty()) {
        flag = BCLog::ALL;
        return true;
    }
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        if (category_desc.category == str) {
            flag = category_desc.flag;
            return true;
        }
    }
    return false;
}

std::string ListLogCategories()
{
    std::string ret;
    int outcount = 0;
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        // Omit the special cases.
        if (category_desc.flag != BCLog::NONE && category_desc.flag != BCLog::ALL) {
            if (outcount != 0) ret += ", ";
            ret += category_desc.category;
            outcount++;
        }
    }
    return ret;
}

static std::string FormatISO8601DateTime(std::time_t nTime)
{
    std::tm ts{};
    gmtime_r(&nTime, &ts);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &ts);
    return buf;
}

namespace BCLog {

Logger::~Logger()
{
    if (m_fileout) {
        fclose(m_fileout);
    }
}

bool Logger::OpenDebugLog()
{
    std::lock_guard<std::mutex> scoped_lock(m_cs);

    if (m_fileout) {
        fclose(m_fileout);
        m_fileout = nullptr;
    }

    m_fileout = fopen(m_file_path.c_str(), "a");
    if (!m_fileout) {
        return false;
    }

    setbuf(m_fileout, nullptr); // unbuffered
    return true;
}

void Logger::ShrinkDebugFile()
{
    std::lock_guard<std::mutex> scoped_lock(m_cs);
    if (m_fileout) {
        fclose(m_fileout);
        m_fileout = nullptr;
    }
    m_print_to_file = false;
}

void Logger::EnableCategory(LogFlags flag)
{
    m_categories |= flag;
}

bool Logger::EnableCategory(const std::string& str)
{
    LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    EnableCategory(flag);
    return true;
}

void Logger::DisableCategory(LogFlags flag)
{
    m_categories &= ~flag;
}

bool Logger::DisableCategory(const std::string& str)
{
    LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    DisableCategory(flag);
    return true;
}

bool Logger::WillLogCategory(LogFlags category) const
{
    return (m_categories.load(std::memory_order_relaxed) & category) != 0;
}

std::string Logger::LogTimestampStr(const std::string& str)
{
    std::string strStamped;

    if (!m_log_timestamps)
        return str;

    if (m_started_new_line) {
        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        strStamped = FormatISO8601DateTime(now) + ' ' + str;
    } else {
        strStamped = str;
    }

    m_started_new_line = !str.empty() && str[str.size() - 1] == '\n';

    return strStamped;
}

void Logger::LogPrintStr(const std::string& str)
{
    std::lock_guard<std::mutex> scoped_lock(m_cs);
    std::string strTimestamped = LogTimestampStr(str);

    if (m_print_to_console) {
        // print to console
        fwrite(strTimestamped.data(), 1, strTimestamped.size(), stdout);
        fflush(stdout);
    }
    if (m_print_to_file && m_fileout) {
        fwrite(strTimestamped.data(), 1, strTimestamped.size(), m_fileout);
    }
}

} // namespace BCLog
