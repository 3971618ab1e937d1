// -*- Mode: C++; c-basic-offset: 4; tab-width: 4; indent-tabs-mode: nil; -*-
#ifndef CARD_CHECK__UTILS_H
#define CARD_CHECK__UTILS_H

#include <string>
#include <stdexcept>

class RunTimeError: public std::runtime_error
{
public:
    RunTimeError(const std::string &msg);
};

bool is_digits(const std::string &s);
bool file_exists(const std::string &file_name);
const std::string get_process_name();
int parse_int(const std::string &s, const std::string &what);

#endif // CARD_CHECK__UTILS_H
// vim:ts=4:sts=4:sw=4:et:
