#include "app/DaemonMain.hpp"

int main(int argc, char *argv[])
{
    return gt::app::daemon_main(argc, argv);
}
