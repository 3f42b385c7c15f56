#include "parabin/preprocess.hpp"

int main(int argc, char **argv)
{
    return parabin::run_preprocess_main(argc, argv);
}
