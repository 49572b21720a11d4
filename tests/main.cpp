#define CATCH_CONFIG_MAIN
#include "catch.hpp"

#include "easylogging++.h"

INITIALIZE_EASYLOGGINGPP
