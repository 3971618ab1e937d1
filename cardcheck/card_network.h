// -*- Mode: C++; c-basic-offset: 4; tab-width: 4; indent-tabs-mode: nil; -*-
#ifndef CARD_CHECK__CARD_NETWORK_H
#define CARD_CHECK__CARD_NETWORK_H

#include <string>

enum CardNetwork
{
    CN_UNKNOWN = 0,
    CN_AMERICAN_EXPRESS,
    CN_AURA,
    CN_BANKCARD,
    CN_CABAL,
    CN_CHINA_UNIONPAY,
    CN_DANKORT,
    CN_DINERS_CLUB_CARTE_BLANCHE,
    CN_DINERS_CLUB_ENROUTE,
    CN_DINERS_CLUB_INTERNATIONAL,
    CN_DISCOVER,
    CN_ELO,
    CN_HIPERCARD,
    CN_INSTAPAYMENT,
    CN_INTERPAYMENT,
    CN_JCB,
    CN_MAESTRO,
    CN_MASTERCARD,
    CN_VISA,
    CN_VISA_ELECTRON,
    CN_COUNT
};

const std::string &card_network_name(CardNetwork network);

// Reverse lookup by display name, CN_UNKNOWN's name is not accepted
bool card_network_from_name(const std::string &name, CardNetwork &network);

#endif // CARD_CHECK__CARD_NETWORK_H
// vim:ts=4:sts=4:sw=4:et:
