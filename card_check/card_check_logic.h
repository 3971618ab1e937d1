// -*- Mode: C++; c-basic-offset: 4; tab-width: 4; indent-tabs-mode: nil; -*-
#ifndef CARD_CHECK__CARD_CHECK_LOGIC_H
#define CARD_CHECK__CARD_CHECK_LOGIC_H

#include <string>
#include <vector>
#include <util/nlogger.h>
#include <util/element_tree.h>
#include "card_validator.h"

Yb::ElementTree::ElementPtr mk_resp(const std::string &status = "success");

void write_validation_to_xml(const Validation &validation,
                             Yb::ElementTree::ElementPtr resp);

class CardCheck
{
    Yb::ILogger::Ptr log_;
    CardValidator validator_;

    CardCheck(const CardCheck &);
    CardCheck &operator=(const CardCheck &);

public:
    CardCheck(Yb::ILogger &log);

    /* args: [-t TYPE] NUMBER MONTH YEAR CVV
     * Sets has_errors when the card didn't pass.
     */
    Yb::ElementTree::ElementPtr check(const std::vector<std::string> &args,
                                      bool &has_errors);
    Yb::ElementTree::ElementPtr check_card(Card &card, bool &has_errors);
    Yb::ElementTree::ElementPtr dump_rules();
};

#endif // CARD_CHECK__CARD_CHECK_LOGIC_H
// vim:ts=4:sts=4:sw=4:et:
