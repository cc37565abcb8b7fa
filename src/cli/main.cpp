#include <phind/cli.hpp>
#include <iostream>

int main(int argc, char** argv) {
    auto opts = phind::parse_args(argc, argv);
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n";
        return 1;
    }

    phind::SystemEnvironment env;
    return phind::run(opts.value(), env, std::cout, std::cerr);
}
