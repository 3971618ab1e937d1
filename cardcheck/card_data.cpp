// -*- Mode: C++; c-basic-offset: 4; tab-width: 4; indent-tabs-mode: nil; -*-
#include <cstring>
#include <util/string_utils.h>
#include "card_data.h"
#include "utils.h"

std::string mask_pan(const std::string &pan)
{
    if (pan.size() < 13 || pan.size() > 20)
        return std::string(pan.size(), '*');
    return pan.substr(0, 6) + std::string(pan.size() - 10, '*') + pan.substr(pan.size() - 4);
}

std::string normalize_pan(const std::string &pan)
{
    std::string r;
    r.reserve(pan.size());
    for (size_t i = 0; i < pan.size(); ++i) {
        const unsigned char c = (unsigned char )pan[i];
        if (c >= '0' && c <= '9')
            r += c;
        else if (!c || !std::strchr(" \t\n\r-", c))
            throw RunTimeError("Wrong character in PAN: " + Yb::to_string((int )c));
    }
    return r;
}

// vim:ts=4:sts=4:sw=4:et:
