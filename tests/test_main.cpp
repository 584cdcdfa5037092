#define CATCH_CONFIG_MAIN
#include <czt/test_base.hpp>
