#include "arbiter/cli.hpp"

int main(int argc, char *argv[])
{
    return arbiter::cli::run(argc, argv);
}
