// -*- Mode: C++; c-basic-offset: 4; tab-width: 4; indent-tabs-mode: nil; -*-
#include "card_check_logic.h"
#include <util/string_utils.h>
#include "bin_rules.h"
#include "utils.h"

static const std::string bool2str(bool x)
{
    return x? "true": "false";
}

Yb::ElementTree::ElementPtr mk_resp(const std::string &status)
{
    Yb::ElementTree::ElementPtr res =
        Yb::ElementTree::new_element("response");
    res->sub_element("status", status);
    return res;
}

void write_validation_to_xml(const Validation &validation,
                             Yb::ElementTree::ElementPtr resp)
{
    Yb::ElementTree::ElementPtr cd = resp->sub_element("card", "");
    const Card &card = *validation.card;
    cd->sub_element("type", card.type);
    cd->sub_element("pan_masked", card.number_masked());
    cd->sub_element("expiry_month", Yb::to_string(card.expiry_month));
    cd->sub_element("expiry_year", Yb::to_string(card.expiry_year));

    Yb::ElementTree::ElementPtr checks = resp->sub_element("checks", "");
    checks->sub_element("valid_card_number",
                        bool2str(validation.valid_card_number));
    checks->sub_element("valid_expiry_month",
                        bool2str(validation.valid_expiry_month));
    checks->sub_element("valid_expiry_year",
                        bool2str(validation.valid_expiry_year));
    checks->sub_element("valid_cvv", bool2str(validation.valid_cvv));
    checks->sub_element("is_expired", bool2str(validation.is_expired));

    Yb::ElementTree::ElementPtr errors = resp->sub_element("errors", "");
    for (size_t i = 0; i < validation.errors.size(); ++i)
        errors->sub_element("error", validation.errors[i]);
}

CardCheck::CardCheck(Yb::ILogger &log)
    : log_(log.new_logger("card_check").release())
    , validator_(log_.get())
{}

Yb::ElementTree::ElementPtr CardCheck::check(
        const std::vector<std::string> &args, bool &has_errors)
{
    std::vector<std::string> positional;
    std::string card_type;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "-t" || args[i] == "--type") {
            if (i + 1 >= args.size())
                throw RunTimeError("option " + args[i] + " needs a value");
            card_type = args[++i];
        }
        else
            positional.push_back(args[i]);
    }
    if (positional.size() != 4)
        throw RunTimeError("expected NUMBER MONTH YEAR CVV, got "
                           + Yb::to_string(positional.size())
                           + " argument(s)");
    Card card(normalize_pan(positional[0]),
              parse_int(positional[1], "month"),
              parse_int(positional[2], "year"),
              positional[3],
              card_type);
    return check_card(card, has_errors);
}

Yb::ElementTree::ElementPtr CardCheck::check_card(Card &card,
                                                  bool &has_errors)
{
    log_->info("checking card " + card.number_masked()
               + (card.type.empty()? "": ", given type: " + card.type));
    Validation validation = validator_.validate(card);
    has_errors = !validation.errors.empty();
    Yb::ElementTree::ElementPtr resp =
        mk_resp(has_errors? "invalid": "success");
    write_validation_to_xml(validation, resp);
    if (has_errors)
        log_->info("card " + card.number_masked() + " has "
                   + Yb::to_string(validation.errors.size())
                   + " error(s)");
    return resp;
}

Yb::ElementTree::ElementPtr CardCheck::dump_rules()
{
    Yb::ElementTree::ElementPtr resp = mk_resp();
    Yb::ElementTree::ElementPtr rules_node = resp->sub_element("rules", "");
    const std::vector<BinRule> &rules = bin_rules();
    int dead_count = 0;
    for (size_t i = 0; i < rules.size(); ++i) {
        const BinRule &rule = rules[i];
        Yb::ElementTree::ElementPtr r = rules_node->sub_element("rule", "");
        r->sub_element("order", Yb::to_string(i + 1));
        r->sub_element("network", card_network_name(rule.network));
        if (rule.min_length > 0)
            r->sub_element("min_length", Yb::to_string(rule.min_length));
        if (rule.max_length != BIN_ANY_LENGTH)
            r->sub_element("max_length", Yb::to_string(rule.max_length));
        for (size_t j = 0; j < rule.ranges.size(); ++j) {
            const PrefixRange &range = rule.ranges[j];
            Yb::ElementTree::ElementPtr p = r->sub_element("prefix", "");
            p->sub_element("length", Yb::to_string(range.length));
            p->sub_element("low", Yb::to_string(range.low));
            p->sub_element("high", Yb::to_string(range.high));
            if (!range.satisfiable()) {
                p->sub_element("dead", "1");
                ++dead_count;
            }
        }
        for (size_t j = 0; j < rule.literals.size(); ++j)
            r->sub_element("literal", rule.literals[j]);
    }
    if (dead_count)
        log_->warning("BIN table has " + Yb::to_string(dead_count)
                      + " range(s) that never match");
    return resp;
}

// vim:ts=4:sts=4:sw=4:et:
