// -*- Mode: C++; c-basic-offset: 4; tab-width: 4; indent-tabs-mode: nil; -*-
#include "app_class.h"
#include <syslog.h>
#include <cstring>
#include <iostream>
#include <sstream>
#include <vector>
#include <boost/regex.hpp>
#include <util/string_utils.h>
#include "utils.h"

const std::string filter_log_msg(const std::string &msg)
{
    static const boost::regex cn_re(
            "([^\\d])(\\d{6})(\\d{3,9})(\\d{4})([^\\d])");
    static const std::string obf_fmt("\\1\\2****\\4\\5");
    std::string fixed_msg = " " + msg + " ";
    while (true) {
        const std::string orig_msg = fixed_msg;
        fixed_msg = boost::regex_replace(
                fixed_msg, cn_re, obf_fmt,
                boost::match_default | boost::format_perl);
        if (fixed_msg == orig_msg)
            break;
    }
    return fixed_msg.substr(1, fixed_msg.size() - 2);
}

using namespace std;

FileLogAppender::FileLogAppender(std::ostream &out)
    : Yb::LogAppender(out)
{}

void FileLogAppender::append(const Yb::LogRecord &rec)
{
    Yb::LogRecord filtered(rec.get_level(), rec.get_component(),
                           filter_log_msg(rec.get_msg()));
    Yb::LogAppender::append(filtered);
}

char SyslogAppender::process_name[100];

int SyslogAppender::log_level_to_syslog(int log_level)
{
    switch (log_level) {
    case Yb::ll_CRITICAL:
        return LOG_CRIT;
    case Yb::ll_ERROR:
        return LOG_ERR;
    case Yb::ll_WARNING:
        return LOG_WARNING;
    case Yb::ll_INFO:
        return LOG_INFO;
    case Yb::ll_DEBUG:
    case Yb::ll_TRACE:
        return LOG_DEBUG;
    }
    return LOG_DEBUG;
}

SyslogAppender::SyslogAppender()
{
    std::string process = get_process_name();
    strncpy(process_name, process.c_str(), sizeof(process_name));
    process_name[sizeof(process_name) - 1] = 0;
    ::openlog(process_name, LOG_NDELAY | LOG_PID, LOG_USER);
}

SyslogAppender::~SyslogAppender()
{
    ::closelog();
}

void SyslogAppender::append(const Yb::LogRecord &rec)
{
    int priority = log_level_to_syslog(rec.get_level());
    std::ostringstream msg;
    msg << "T" << rec.get_tid() << " "
        << rec.get_component() << ": "
        << filter_log_msg(rec.get_msg());
    ::syslog(priority, "%s", msg.str().c_str());
}

int decode_log_level(const string &log_level0)
{
    using Yb::StrUtils::str_to_lower;
    const string log_level = str_to_lower(log_level0);
    if (log_level.empty())
        return Yb::ll_INFO;
    if (log_level == "critical" || log_level == "cri" || log_level == "crit")
        return Yb::ll_CRITICAL;
    if (log_level == "error"    || log_level == "err" || log_level == "erro")
        return Yb::ll_ERROR;
    if (log_level == "warning"  || log_level == "wrn" || log_level == "warn")
        return Yb::ll_WARNING;
    if (log_level == "info"     || log_level == "inf")
        return Yb::ll_INFO;
    if (log_level == "debug"    || log_level == "dbg" || log_level == "debg")
        return Yb::ll_DEBUG;
    if (log_level == "trace"    || log_level == "trc" || log_level == "trac")
        return Yb::ll_TRACE;
    throw RunTimeError("invalid log level: " + log_level);
}

static const string encode_log_level(int level)
{
    Yb::LogRecord r(level, "__xxx__", "yyy");
    return string(r.get_level_name());
}

void App::init_log(const string &log_name, const string &log_level)
{
    using Yb::StrUtils::split_str_by_chars;
    using Yb::StrUtils::trim_trailing_space;
    using Yb::StrUtils::str_to_lower;
    if (log_.get())
        return;
    if ("syslog" == str_to_lower(log_name)) {
        appender_.reset(new SyslogAppender());
    }
    else if (log_name.empty() || "-" == log_name) {
        appender_.reset(new FileLogAppender(std::cerr));
    }
    else {
        file_stream_.reset(new ofstream(log_name.data(), ios::app));
        if (file_stream_->fail())
            throw RunTimeError("can't open logfile: " + log_name);
        appender_.reset(new FileLogAppender(*file_stream_));
    }
    log_.reset(new Yb::Logger(appender_.get()));
    const int root_level = decode_log_level(log_level);
    log_->set_level(root_level);
    debug("Setting level " + encode_log_level(root_level)
            + " for root logger");
    const string target_levels_s = cfg().get_value_default("LogLevel", "");
    vector<string> target_levels;
    split_str_by_chars(target_levels_s, ",", target_levels);
    auto i = target_levels.begin(), iend = target_levels.end();
    for (; i != iend; ++i) {
        auto &target_level = *i;
        vector<string> parts;
        split_str_by_chars(target_level, ":", parts, 2);
        if (parts.size() == 2) {
            auto target = trim_trailing_space(parts[0]);
            auto level = trim_trailing_space(parts[1]);
            debug("Setting level " + encode_log_level(decode_log_level(level))
                    + " for log target " + target);
            log_->get_logger(target)->set_level(decode_log_level(level));
        }
    }
}

void App::init(IConfig::Ptr config)
{
    config_.reset(config.release());
    init_log(cfg().get_value_default("Log", "-"),
             cfg().get_value_default("Log/@level", "info"));
}

IConfig &App::cfg()
{
    if (!config_.get())
        throw RunTimeError("config not loaded");
    return *config_.get();
}

App::~App()
{
    if (log_.get()) {
        Yb::LogAppender *appender = dynamic_cast<Yb::LogAppender *> (
                appender_.get());
        if (appender)
            appender->flush();
        if (file_stream_.get())
            file_stream_->close();
    }
    log_.reset(NULL);
    appender_.reset(NULL);
    file_stream_.reset(NULL);
}

Yb::ILogger::Ptr App::new_logger(const string &name)
{
    if (!log_.get())
        throw RunTimeError("log not opened");
    return log_->new_logger(name);
}

Yb::ILogger::Ptr App::get_logger(const std::string &name)
{
    if (!log_.get())
        throw RunTimeError("log not opened");
    return log_->get_logger(name);
}

int App::get_level()
{
    if (!log_.get())
        throw RunTimeError("log not opened");
    return log_->get_level();
}

void App::set_level(int level)
{
    if (!log_.get())
        throw RunTimeError("log not opened");
    log_->set_level(level);
}

void App::log(int level, const string &msg)
{
    if (log_.get())
        log_->log(level, msg);
}

const string App::get_name() const
{
    if (!log_.get())
        return string();
    return log_->get_name();
}

// vim:ts=4:sts=4:sw=4:et:
