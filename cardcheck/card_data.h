// -*- Mode: C++; c-basic-offset: 4; tab-width: 4; indent-tabs-mode: nil; -*-
#ifndef CARD_CHECK__CARD_DATA_H
#define CARD_CHECK__CARD_DATA_H

#include <string>

std::string mask_pan(const std::string &pan);
std::string normalize_pan(const std::string &pan);

/* The following fields are recognized:
 * type (optional network display name), number, expiry_month,
 * expiry_year, cvv.
 *
 * type is filled in by CardValidator when it's empty.
 */
struct Card
{
    Card()
        : expiry_month(0)
        , expiry_year(0)
    {}

    Card(const std::string &_number,
         int _expiry_month, int _expiry_year,
         const std::string &_cvv,
         const std::string &_type = "")
        : type(_type)
        , number(_number)
        , expiry_month(_expiry_month)
        , expiry_year(_expiry_year)
        , cvv(_cvv)
    {}

    const std::string number_masked() const { return mask_pan(number); }

    // public fields:
    std::string type, number;
    int expiry_month, expiry_year;
    std::string cvv;
};

#endif // CARD_CHECK__CARD_DATA_H
// vim:ts=4:sts=4:sw=4:et:
