// -*- Mode: C++; c-basic-offset: 4; tab-width: 4; indent-tabs-mode: nil; -*-
#define CATCH_CONFIG_MAIN  // This tells Catch to provide a main() - only do this in one cpp file
#include <sstream>
#include <string>
#include <vector>
#include <util/nlogger.h>
#include <util/element_tree.h>

#include <catch2/catch.hpp>

#include "utils.h"
#include "card_check_logic.h"

static const std::string text_of(Yb::ElementTree::ElementPtr node,
                                 const std::string &name)
{
    return node->find_first(name)->get_text();
}

static std::vector<std::string> mk_args(const std::string &line)
{
    std::vector<std::string> args;
    std::istringstream inp(line);
    std::string word;
    while (inp >> word)
        args.push_back(word);
    return args;
}

TEST_CASE( "Testing card check command", "[card_check]" ) {
    std::ostringstream out;
    Yb::LogAppender appender(out);
    Yb::Logger::Ptr logger(new Yb::Logger(&appender));
    logger->set_level(Yb::ll_DEBUG);
    logger->get_logger("card_check")->set_level(Yb::ll_DEBUG);
    CardCheck card_check(*logger);
    bool has_errors = true;

    SECTION( "testing clean card" ) {
        auto resp = card_check.check(
                mk_args("4111111111111112 11 2100 123"), has_errors);
        CHECK( !has_errors );
        CHECK( "success" == text_of(resp, "status") );
        auto card = resp->find_first("card");
        CHECK( "Visa" == text_of(card, "type") );
        CHECK( "411111******1112" == text_of(card, "pan_masked") );
        CHECK( "11" == text_of(card, "expiry_month") );
        CHECK( "2100" == text_of(card, "expiry_year") );
        auto checks = resp->find_first("checks");
        CHECK( "false" == text_of(checks, "valid_card_number") );
        CHECK( "true" == text_of(checks, "valid_expiry_month") );
        CHECK( "true" == text_of(checks, "valid_expiry_year") );
        CHECK( "false" == text_of(checks, "valid_cvv") );
        CHECK( "false" == text_of(checks, "is_expired") );
        CHECK( resp->find_first("errors")->find_children("error")->empty() );
        CHECK( resp->serialize().find("4111111111111112")
                == std::string::npos );
    }

    SECTION( "testing card with errors" ) {
        auto resp = card_check.check(
                mk_args("4111111111111111 13 2100 1234"), has_errors);
        CHECK( has_errors );
        CHECK( "invalid" == text_of(resp, "status") );
        auto errors = resp->find_first("errors")->find_children("error");
        REQUIRE( 4 == errors->size() );
        CHECK( "month '13' is not a valid month" == (*errors)[0]->get_text() );
        CHECK( "creditcard is expired" == (*errors)[1]->get_text() );
        CHECK( "cvv doesn't match" == (*errors)[2]->get_text() );
        CHECK( "card number is not valid" == (*errors)[3]->get_text() );
    }

    SECTION( "testing separators in number" ) {
        std::vector<std::string> args;
        args.push_back("4111 1111-1111 1112");
        args.push_back("11");
        args.push_back("2100");
        args.push_back("123");
        auto resp = card_check.check(args, has_errors);
        CHECK( !has_errors );
        CHECK( "411111******1112" ==
                text_of(resp->find_first("card"), "pan_masked") );
    }

    SECTION( "testing given type" ) {
        auto resp = card_check.check(
                mk_args("-t Mastercard 4111111111111112 11 2100 123"),
                has_errors);
        CHECK( has_errors );
        CHECK( "Mastercard" == text_of(resp->find_first("card"), "type") );
        auto errors = resp->find_first("errors")->find_children("error");
        REQUIRE( 1 == errors->size() );
        CHECK( "given card type doesn't match determined card type" ==
                (*errors)[0]->get_text() );

        std::vector<std::string> args;
        args.push_back("--type");
        args.push_back("American Express");
        args.push_back("378282246310006");
        args.push_back("11");
        args.push_back("2100");
        args.push_back("1234");
        resp = card_check.check(args, has_errors);
        CHECK( !has_errors );
        CHECK( "success" == text_of(resp, "status") );
    }

    SECTION( "testing bad arguments" ) {
        CHECK_THROWS_AS( card_check.check(mk_args("4111111111111112 11 2100"),
                                          has_errors), RunTimeError );
        CHECK_THROWS_AS( card_check.check(
                    mk_args("4111111111111112 11 2100 123 x"), has_errors),
                RunTimeError );
        CHECK_THROWS_AS( card_check.check(mk_args("4111111111111112 11 2100 -t"),
                                          has_errors), RunTimeError );
        CHECK_THROWS_AS( card_check.check(
                    mk_args("4111111111111112 nov 2100 123"), has_errors),
                RunTimeError );
        CHECK_THROWS_AS( card_check.check(
                    mk_args("4111x11111111112 11 2100 123"), has_errors),
                RunTimeError );
    }

    SECTION( "testing log lines" ) {
        card_check.check(mk_args("4111111111111111 11 2100 123"), has_errors);
        appender.flush();
        const std::string text = out.str();
        CHECK( text.find("checking card 411111******1111")
                != std::string::npos );
        CHECK( text.find("has 1 error(s)") != std::string::npos );
    }
}

TEST_CASE( "Testing BIN table dump", "[card_check]" ) {
    std::ostringstream out;
    Yb::LogAppender appender(out);
    Yb::Logger::Ptr logger(new Yb::Logger(&appender));
    logger->set_level(Yb::ll_DEBUG);
    logger->get_logger("card_check")->set_level(Yb::ll_DEBUG);
    CardCheck card_check(*logger);

    auto resp = card_check.dump_rules();
    CHECK( "success" == text_of(resp, "status") );
    auto rules = resp->find_first("rules")->find_children("rule");
    REQUIRE( 19 == rules->size() );

    auto elo = (*rules)[0];
    CHECK( "1" == text_of(elo, "order") );
    CHECK( "Elo" == text_of(elo, "network") );
    auto carte_blanche = (*rules)[6];
    CHECK( "Diners Club Carte Blanche" == text_of(carte_blanche, "network") );
    CHECK( "15" == text_of(carte_blanche, "min_length") );
    CHECK( "15" == text_of(carte_blanche, "max_length") );
    CHECK( (*rules)[18]->find_children("max_length")->empty() );
    CHECK( "0604" == text_of((*rules)[12], "literal") );

    int dead = 0;
    for (size_t i = 0; i < rules->size(); ++i) {
        auto prefixes = (*rules)[i]->find_children("prefix");
        for (size_t j = 0; j < prefixes->size(); ++j) {
            auto marks = (*prefixes)[j]->find_children("dead");
            if (!marks->empty()) {
                CHECK( "1" == marks->front()->get_text() );
                ++dead;
            }
        }
    }
    CHECK( 5 == dead );

    appender.flush();
    CHECK( out.str().find("5 range(s) that never match") != std::string::npos );
}

// vim:ts=4:sts=4:sw=4:et:
