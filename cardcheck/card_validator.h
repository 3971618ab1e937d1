// -*- Mode: C++; c-basic-offset: 4; tab-width: 4; indent-tabs-mode: nil; -*-
#ifndef CARD_CHECK__CARD_VALIDATOR_H
#define CARD_CHECK__CARD_VALIDATOR_H

#include <string>
#include <vector>
#include <util/data_types.h>
#include <util/nlogger.h>
#include "card_data.h"
#include "card_network.h"

#define CVV_LENGTH_AMEX     4
#define CVV_LENGTH_DEFAULT  3

#define EXPIRY_YEAR_MIN     1900
#define EXPIRY_YEAR_MAX     2200

/* Outcome of CardValidator::validate(), one per call.
 *
 * NOTE: valid_cvv and valid_card_number have inverted meaning:
 * valid_cvv is true when the CVV length does NOT fit the network,
 * valid_card_number is true when the number passes the Luhn check.
 * Both are reported in errors when true.
 */
struct Validation
{
    explicit Validation(Card *_card = NULL)
        : card(_card)
        , valid_card_number(false)
        , valid_expiry_month(false)
        , valid_expiry_year(false)
        , valid_cvv(false)
        , is_expired(false)
    {}

    bool has_error(const std::string &msg) const;

    Card *card;
    bool valid_card_number;
    bool valid_expiry_month;
    bool valid_expiry_year;
    bool valid_cvv;
    bool is_expired;
    std::vector<std::string> errors;
};

bool valid_expiry_month(int month);
bool valid_expiry_year(int year);
bool is_card_expired(int month, int year, const Yb::DateTime &now);
size_t required_cvv_length(const std::string &card_type);

class CardValidator
{
    Yb::ILogger::Ptr log_;

    bool check_card_number(const Card &card, Validation &result);

    CardValidator(const CardValidator &);
    CardValidator &operator=(const CardValidator &);
public:
    explicit CardValidator(Yb::ILogger *logger = NULL);

    /* Writes the detected network name into card.type when it's empty,
     * the returned Validation points to the same card.
     */
    Validation validate(Card &card);
    Validation validate(Card &card, const Yb::DateTime &now);
};

#endif // CARD_CHECK__CARD_VALIDATOR_H
// vim:ts=4:sts=4:sw=4:et:
