#include "woot/woot.h"

int
main (int argc, const char *argv[])
{
    return woot::run (argc, argv);
}
