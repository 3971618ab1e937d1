// -*- Mode: C++; c-basic-offset: 4; tab-width: 4; indent-tabs-mode: nil; -*-
#include <algorithm>
#include <util/string_utils.h>
#include "card_validator.h"
#include "bin_rules.h"
#include "luhn.h"

bool Validation::has_error(const std::string &msg) const
{
    return std::find(errors.begin(), errors.end(), msg) != errors.end();
}

bool valid_expiry_month(int month)
{
    return month >= 1 && month <= 12;
}

bool valid_expiry_year(int year)
{
    return year >= EXPIRY_YEAR_MIN && year <= EXPIRY_YEAR_MAX;
}

bool is_card_expired(int month, int year, const Yb::DateTime &now)
{
    if (!valid_expiry_month(month) || !valid_expiry_year(year))
        return true;
    return Yb::dt_make(year, month, 1) < now;
}

size_t required_cvv_length(const std::string &card_type)
{
    if (card_type == card_network_name(CN_AMERICAN_EXPRESS))
        return CVV_LENGTH_AMEX;
    return CVV_LENGTH_DEFAULT;
}

CardValidator::CardValidator(Yb::ILogger *logger)
    : log_(logger? logger->new_logger("card_validator").release(): NULL)
{}

Validation CardValidator::validate(Card &card)
{
    return validate(card, Yb::now());
}

Validation CardValidator::validate(Card &card, const Yb::DateTime &now)
{
    Validation result(&card);

    result.valid_expiry_month = valid_expiry_month(card.expiry_month);
    if (!result.valid_expiry_month)
        result.errors.push_back("month '" + Yb::to_string(card.expiry_month)
                                + "' is not a valid month");

    result.valid_expiry_year = valid_expiry_year(card.expiry_year);
    if (!result.valid_expiry_year)
        result.errors.push_back("year '" + Yb::to_string(card.expiry_year)
                                + "' is not a valid year");

    result.is_expired = is_card_expired(card.expiry_month,
                                        card.expiry_year, now);
    if (result.is_expired)
        result.errors.push_back("creditcard is expired");

    if (card.type.empty()) {
        CardNetwork network;
        if (classify_card_number(card.number, network))
            card.type = card_network_name(network);
        else
            result.errors.push_back(UNKNOWN_CARD_TYPE_MSG);
    }

    result.valid_cvv = card.cvv.size() != required_cvv_length(card.type);
    if (result.valid_cvv)
        result.errors.push_back("cvv doesn't match");

    result.valid_card_number = check_card_number(card, result);
    if (result.valid_card_number)
        result.errors.push_back("card number is not valid");

    if (log_.get())
        log_->debug("validated " + card.number_masked()
                    + ", type: '" + card.type
                    + "', errors: " + Yb::to_string(result.errors.size()));
    return result;
}

bool CardValidator::check_card_number(const Card &card, Validation &result)
{
    CardNetwork network;
    if (!classify_card_number(card.number, network)) {
        result.errors.push_back(UNKNOWN_CARD_TYPE_MSG);
        return false;
    }
    if (card_network_name(network) != card.type) {
        result.errors.push_back(
                "given card type doesn't match determined card type");
        return false;
    }
    return validate_luhn(card.number);
}

// vim:ts=4:sts=4:sw=4:et:
