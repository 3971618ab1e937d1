// -*- Mode: C++; c-basic-offset: 4; tab-width: 4; indent-tabs-mode: nil; -*-
#include "card_network.h"
#include "utils.h"

static const std::string network_names[CN_COUNT] = {
    "Unknown Card",
    "American Express",
    "Aura",
    "Bankcard",
    "Cabal",
    "China UnionPay",
    "Dankort",
    "Diners Club Carte Blanche",
    "Diners Club Enroute",
    "Diners Club International",
    "Discover",
    "Elo",
    "Hipercard",
    "InstaPayment",
    "InterPayment",
    "JCB",
    "Maestro",
    "Mastercard",
    "Visa",
    "Visa Electron",
};

const std::string &card_network_name(CardNetwork network)
{
    if (network < CN_UNKNOWN || network >= CN_COUNT)
        throw RunTimeError("invalid card network");
    return network_names[network];
}

bool card_network_from_name(const std::string &name, CardNetwork &network)
{
    for (int i = CN_UNKNOWN + 1; i < CN_COUNT; ++i) {
        if (network_names[i] == name) {
            network = static_cast<CardNetwork>(i);
            return true;
        }
    }
    return false;
}

// vim:ts=4:sts=4:sw=4:et:
