// -*- Mode: C++; c-basic-offset: 4; tab-width: 4; indent-tabs-mode: nil; -*-
#include <util/string_utils.h>
#include "bin_rules.h"
#include "utils.h"

const std::string UNKNOWN_CARD_TYPE_MSG = "unknown creditcard type";

CardPrefixes::CardPrefixes(const std::string &number)
    : number_(number)
    , available_(0)
{
    int value = 0;
    for (int i = 0; i < BIN_MAX_PREFIX && i < (int)number_.size(); ++i) {
        const char c = number_[i];
        if (c < '0' || c > '9')
            break;
        value = value * 10 + (c - '0');
        values_[i] = value;
        available_ = i + 1;
    }
}

bool CardPrefixes::has(int length) const
{
    return length >= 1 && length <= available_;
}

int CardPrefixes::at(int length) const
{
    if (!has(length))
        throw RunTimeError("prefix of length " + Yb::to_string(length) +
                           " is not available");
    return values_[length - 1];
}

bool CardPrefixes::starts_with(const std::string &literal) const
{
    return number_.size() >= literal.size() &&
        number_.compare(0, literal.size(), literal) == 0;
}

bool PrefixRange::matches(const CardPrefixes &prefixes) const
{
    if (!prefixes.has(length))
        return false;
    const int value = prefixes.at(length);
    return value >= low && value <= high;
}

bool PrefixRange::satisfiable() const
{
    int max_value = 1;
    for (int i = 0; i < length; ++i)
        max_value *= 10;
    return length >= 1 && length <= BIN_MAX_PREFIX &&
        low <= high && low < max_value;
}

PrefixRange bin_exact(int length, int value)
{
    PrefixRange r = { length, value, value };
    return r;
}

PrefixRange bin_range(int length, int low, int high)
{
    PrefixRange r = { length, low, high };
    return r;
}

bool BinRule::matches(const CardPrefixes &prefixes) const
{
    if (prefixes.number_length() < min_length ||
            prefixes.number_length() > max_length)
        return false;
    for (size_t i = 0; i < ranges.size(); ++i)
        if (ranges[i].matches(prefixes))
            return true;
    for (size_t i = 0; i < literals.size(); ++i)
        if (prefixes.starts_with(literals[i]))
            return true;
    return false;
}

static std::vector<BinRule> build_bin_rules()
{
    const std::vector<std::string> none;
    std::vector<BinRule> rules{
        {CN_ELO, {
            bin_exact(4, 4011), bin_exact(6, 431274), bin_exact(6, 438935),
            bin_exact(6, 451416), bin_exact(6, 457393), bin_exact(4, 4576),
            bin_exact(6, 457631), bin_exact(6, 457632), bin_exact(6, 504175),
            bin_exact(6, 627780), bin_exact(6, 636297), bin_exact(6, 636368),
            bin_exact(6, 636369),
            bin_range(6, 506699, 506778),
            bin_range(6, 509000, 509999),
            bin_range(6, 650031, 650051),
            // empty range, never matches
            bin_range(6, 650035, 650033),
            bin_range(6, 650405, 650439),
            bin_range(6, 650485, 650538),
            bin_range(6, 650541, 650598),
            bin_range(6, 650700, 650718),
            bin_range(6, 650720, 650727),
            bin_range(6, 650901, 650920),
            bin_range(6, 651652, 651679),
            bin_range(6, 655000, 655019),
            bin_range(6, 655021, 655021),
         }, none, 0, BIN_ANY_LENGTH},

        {CN_CABAL, {
            bin_range(6, 604201, 604219),
         }, none, 0, BIN_ANY_LENGTH},

        // the last four are six digit values under a four digit prefix
        {CN_HIPERCARD, {
            bin_exact(6, 384100), bin_exact(6, 384140), bin_exact(6, 384160),
            bin_exact(6, 606282), bin_exact(6, 637095),
            bin_exact(4, 637568), bin_exact(4, 637599),
            bin_exact(4, 637609), bin_exact(4, 637612),
         }, none, 0, BIN_ANY_LENGTH},

        {CN_AMERICAN_EXPRESS, {
            bin_exact(2, 34), bin_exact(2, 37),
         }, none, 0, BIN_ANY_LENGTH},

        {CN_BANKCARD, {
            bin_exact(4, 5610), bin_range(6, 560221, 560225),
         }, none, 0, BIN_ANY_LENGTH},

        {CN_CHINA_UNIONPAY, {
            bin_exact(2, 62),
         }, none, 0, BIN_ANY_LENGTH},

        {CN_DINERS_CLUB_CARTE_BLANCHE, {
            bin_range(3, 300, 305),
         }, none, 15, 15},

        {CN_DINERS_CLUB_ENROUTE, {
            bin_exact(4, 2014), bin_exact(4, 2149),
         }, none, 0, BIN_ANY_LENGTH},

        {CN_DINERS_CLUB_INTERNATIONAL, {
            bin_range(3, 300, 305), bin_exact(3, 309),
            bin_exact(2, 36), bin_exact(2, 38), bin_exact(2, 39),
         }, none, 0, 14},

        {CN_DISCOVER, {
            bin_exact(4, 6011), bin_range(6, 622126, 622925),
            bin_range(3, 644, 649), bin_exact(2, 65),
         }, none, 0, BIN_ANY_LENGTH},

        {CN_INTERPAYMENT, {
            bin_exact(3, 636),
         }, none, 16, 19},

        {CN_INSTAPAYMENT, {
            bin_range(3, 637, 639),
         }, none, 16, 16},

        {CN_MAESTRO, {
            bin_exact(4, 5018), bin_exact(4, 5020), bin_exact(4, 5038),
            bin_exact(4, 5612), bin_exact(4, 5893), bin_exact(4, 6304),
            bin_exact(4, 6759), bin_exact(4, 6761), bin_exact(4, 6762),
            bin_exact(4, 6763), bin_exact(4, 6390),
         }, {"0604"}, 0, BIN_ANY_LENGTH},

        {CN_DANKORT, {
            bin_exact(4, 5019),
         }, none, 0, BIN_ANY_LENGTH},

        {CN_MASTERCARD, {
            bin_range(2, 51, 55),
         }, none, 0, BIN_ANY_LENGTH},

        {CN_JCB, {
            bin_exact(2, 35),
         }, none, 0, BIN_ANY_LENGTH},

        {CN_AURA, {
            bin_exact(2, 50),
         }, none, 0, BIN_ANY_LENGTH},

        {CN_VISA_ELECTRON, {
            bin_exact(4, 4026), bin_exact(6, 417500), bin_exact(4, 4405),
            bin_exact(4, 4508), bin_exact(4, 4844), bin_exact(4, 4913),
            bin_exact(4, 4917),
         }, none, 0, BIN_ANY_LENGTH},

        {CN_VISA, {
            bin_exact(1, 4),
         }, none, 0, BIN_ANY_LENGTH},
    };
    return rules;
}

const std::vector<BinRule> &bin_rules()
{
    static const std::vector<BinRule> rules = build_bin_rules();
    return rules;
}

bool classify_card_number(const std::string &number, CardNetwork &network)
{
    const CardPrefixes prefixes(number);
    const std::vector<BinRule> &rules = bin_rules();
    for (size_t i = 0; i < rules.size(); ++i) {
        if (rules[i].matches(prefixes)) {
            network = rules[i].network;
            return true;
        }
    }
    network = CN_UNKNOWN;
    return false;
}

// vim:ts=4:sts=4:sw=4:et:
