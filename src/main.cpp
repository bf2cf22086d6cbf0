#include "cdm/driver.hpp"
#include "cdm/util/args.hpp"
#include "fmt/format.h"
#include <cstdio>

int main(int argc, char **argv)
{
    using namespace cdm;

    try
    {
        const QueryOptions opts = parse_options(argc, argv);
        fmt::print("{}", run_query(opts));
    }
    catch (const invalid_option &e)
    {
        fmt::print(stderr, "cdm: error: {}\n", e.what());
        fmt::print(stderr, "{}", usage());
        return 1;
    }

    return 0;
}
