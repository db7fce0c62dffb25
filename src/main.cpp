/*
 * vectrix C++17 - Local Vector Database
 *
 * Usage:
 *   ./vectrix <command> <index> [options]
 */
#include <vectrix/cli/application.hpp>

int main(int argc, char* argv[]) {
    vectrix::Application app;
    return app.run(argc, argv);
}
