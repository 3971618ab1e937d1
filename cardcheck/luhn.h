// -*- Mode: C++; c-basic-offset: 4; tab-width: 4; indent-tabs-mode: nil; -*-
#ifndef CARD_CHECK__LUHN_H
#define CARD_CHECK__LUHN_H

#include <string>

#define LUHN_MIN_LENGTH 13
#define LUHN_MAX_LENGTH 19

// http://en.wikipedia.org/wiki/Luhn_algorithm
char luhn_control_digit(const char *num, size_t len);
bool luhn_check(const char *num, size_t len);

// Luhn check of a 13..19 digit card number
bool validate_luhn(const std::string &number);

#endif // CARD_CHECK__LUHN_H
// vim:ts=4:sts=4:sw=4:et:
