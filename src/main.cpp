#include "veil/cli.hpp"

int main(int argc, char *argv[])
{
    return veil::cli::run(argc, argv);
}
