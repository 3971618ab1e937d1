// -*- Mode: C++; c-basic-offset: 4; tab-width: 4; indent-tabs-mode: nil; -*-
#include <fstream>
#include <iterator>
#include <boost/lexical_cast.hpp>
#include "utils.h"

RunTimeError::RunTimeError(const std::string &msg)
    : runtime_error(msg)
{}

bool is_digits(const std::string &s)
{
    for (size_t i = 0; i < s.size(); ++i)
        if (s[i] < '0' || s[i] > '9')
            return false;
    return true;
}

bool file_exists(const std::string &file_name)
{
    std::ifstream inp(file_name.c_str());
    return inp.good();
}

const std::string get_process_name()
{
    const std::string file_name = "/proc/self/cmdline";
    std::ifstream inp(file_name.c_str());
    if (!inp)
        throw ::RunTimeError("can't open file: " + file_name);
    std::string cmdline;
    std::copy(std::istream_iterator<char>(inp),
              std::istream_iterator<char>(),
              std::back_inserter(cmdline));
    size_t pos = cmdline.find('\0');
    if (std::string::npos != pos)
        cmdline = cmdline.substr(0, pos);
    pos = cmdline.rfind('/');
    if (std::string::npos != pos)
        cmdline = cmdline.substr(pos + 1);
    return cmdline;
}

int parse_int(const std::string &s, const std::string &what)
{
    try {
        return boost::lexical_cast<int>(s);
    }
    catch (const boost::bad_lexical_cast &) {
        throw ::RunTimeError("invalid " + what + ": '" + s + "'");
    }
}

// vim:ts=4:sts=4:sw=4:et:
