// -*- Mode: C++; c-basic-offset: 4; tab-width: 4; indent-tabs-mode: nil; -*-
#ifndef CARD_CHECK__BIN_RULES_H
#define CARD_CHECK__BIN_RULES_H

#include <string>
#include <vector>
#include "card_network.h"

#define BIN_MAX_PREFIX 6
#define BIN_ANY_LENGTH std::string::npos

extern const std::string UNKNOWN_CARD_TYPE_MSG;

/* Leading digits of a card number taken as integers of length 1..6.
 * A prefix is available only if the number is long enough and
 * all of its characters are decimal digits.
 */
class CardPrefixes
{
public:
    explicit CardPrefixes(const std::string &number);

    bool has(int length) const;
    int at(int length) const;
    size_t number_length() const { return number_.size(); }
    bool starts_with(const std::string &literal) const;

private:
    std::string number_;
    int values_[BIN_MAX_PREFIX];
    int available_;
};

// Inclusive range test on the prefix of the given length
struct PrefixRange
{
    int length, low, high;

    bool matches(const CardPrefixes &prefixes) const;
    bool satisfiable() const;
};

PrefixRange bin_exact(int length, int value);
PrefixRange bin_range(int length, int low, int high);

/* Disjunction of ranges and literal leading strings,
 * conjoined with a bound on the total number length.
 */
struct BinRule
{
    CardNetwork network;
    std::vector<PrefixRange> ranges;
    std::vector<std::string> literals;
    size_t min_length, max_length;

    bool matches(const CardPrefixes &prefixes) const;
};

// Ordered table, the first matching rule wins
const std::vector<BinRule> &bin_rules();

bool classify_card_number(const std::string &number, CardNetwork &network);

#endif // CARD_CHECK__BIN_RULES_H
// vim:ts=4:sts=4:sw=4:et:
