#include "parabin/dump.hpp"

int main(int argc, char **argv)
{
    return parabin::run_dump_main(argc, argv);
}
