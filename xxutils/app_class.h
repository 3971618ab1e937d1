// -*- Mode: C++; c-basic-offset: 4; tab-width: 4; indent-tabs-mode: nil; -*-
#ifndef CARD_CHECK__APP_CLASS_H
#define CARD_CHECK__APP_CLASS_H

#include <memory>
#include <string>
#include <fstream>
#include <util/nlogger.h>
#include <util/singleton.h>
#include "conf_reader.h"

// Masks PANs (13..19 digits) in a log message
const std::string filter_log_msg(const std::string &msg);

int decode_log_level(const std::string &log_level);

class FileLogAppender: public Yb::LogAppender
{
public:
    FileLogAppender(std::ostream &out);
    void append(const Yb::LogRecord &rec);
};

class SyslogAppender: public Yb::ILogAppender
{
    static char process_name[100];

    static int log_level_to_syslog(int log_level);

public:
    SyslogAppender();
    ~SyslogAppender();
    void append(const Yb::LogRecord &rec);
};

class App: public Yb::ILogger
{
    IConfig::Ptr config_;
    std::auto_ptr<std::ofstream> file_stream_;
    std::auto_ptr<Yb::ILogAppender> appender_;
    Yb::ILogger::Ptr log_;

    void init_log(const std::string &log_name,
                  const std::string &log_level);
public:
    App() {}
    void init(IConfig::Ptr config);
    virtual ~App();
    IConfig &cfg();

    // implement ILogger
    Yb::ILogger::Ptr new_logger(const std::string &name);
    Yb::ILogger::Ptr get_logger(const std::string &name);
    int get_level();
    void set_level(int level);
    void log(int level, const std::string &msg);
    const std::string get_name() const;
};

typedef Yb::SingletonHolder<App> theApp;

#endif // CARD_CHECK__APP_CLASS_H
// vim:ts=4:sts=4:sw=4:et:
