// -*- Mode: C++; c-basic-offset: 4; tab-width: 4; indent-tabs-mode: nil; -*-
#include "luhn.h"
#include "utils.h"

static int luhn_sum(const char *num, size_t len, bool double_last)
{
    int sum = 0;
    bool alternate = double_last;
    for (size_t i = len; i > 0; --i) {
        const char c = num[i - 1];
        if (c < '0' || c > '9')
            throw RunTimeError("Wrong character in card number");
        int d = c - '0';
        if (alternate) {
            d *= 2;
            if (d > 9)
                d = (d % 10) + 1;
        }
        alternate = !alternate;
        sum += d;
    }
    return sum;
}

char luhn_control_digit(const char *num, size_t len)
{
    const int sum = luhn_sum(num, len, true);
    return '0' + (10 - sum % 10) % 10;
}

bool luhn_check(const char *num, size_t len)
{
    return luhn_sum(num, len, false) % 10 == 0;
}

bool validate_luhn(const std::string &number)
{
    if (number.size() < LUHN_MIN_LENGTH || number.size() > LUHN_MAX_LENGTH)
        return false;
    if (!is_digits(number))
        return false;
    return luhn_check(number.data(), number.size());
}

// vim:ts=4:sts=4:sw=4:et:
