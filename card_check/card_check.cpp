// -*- Mode: C++; c-basic-offset: 4; tab-width: 4; indent-tabs-mode: nil; -*-
#include <iostream>
#include <string>
#include <vector>
#include "app_class.h"
#include "card_check_logic.h"

#define EXIT_CARD_OK      0
#define EXIT_FAILURE_RT   1
#define EXIT_CARD_INVALID 2

static void usage(const char *prog)
{
    std::cerr << "usage: " << prog << " [-t TYPE] NUMBER MONTH YEAR CVV\n"
              << "       " << prog << " --rules\n";
}

int main(int argc, char *argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        usage(argv[0]);
        return args.empty()? EXIT_FAILURE_RT: EXIT_CARD_OK;
    }
    Yb::ILogger::Ptr logger;
    try {
        theApp::instance().init(
                open_config("/etc/card_check/card_check.cfg.xml"));
        logger.reset(theApp::instance().new_logger("main").release());
    }
    catch (const std::exception &ex) {
        std::cerr << "exception: " << ex.what() << "\n";
        return EXIT_FAILURE_RT;
    }
    try {
        CardCheck card_check(theApp::instance());
        Yb::ElementTree::ElementPtr resp;
        bool has_errors = false;
        if (args[0] == "--rules")
            resp = card_check.dump_rules();
        else
            resp = card_check.check(args, has_errors);
        std::cout << resp->serialize() << std::endl;
        return has_errors? EXIT_CARD_INVALID: EXIT_CARD_OK;
    }
    catch (const std::exception &ex) {
        logger->error(std::string("exception: ") + ex.what());
        usage(argv[0]);
        return EXIT_FAILURE_RT;
    }
}

// vim:ts=4:sts=4:sw=4:et:
