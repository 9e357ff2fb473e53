// ResolvGuard: DNS provider switcher (C++23)

#include "rg/app.hpp"
#include "rg/cli.hpp"
#include "rg/options.hpp"

int main(int argc, char **argv)
{
    rg::Options opt;
    if (argc <= 1)
    {
        rg::print_usage(argv[0]);
        return rg::kExitUsage;
    }
    if (!rg::parse_args(argc, argv, opt))
    {
        if (opt.command == rg::Command::None) rg::print_usage(argv[0]);
        return rg::kExitUsage;
    }
    if (opt.command == rg::Command::Help)
    {
        rg::print_usage(argv[0]);
        return rg::kExitOk;
    }
    return rg::run_app(opt);
}
