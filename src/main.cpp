#include "wslgate/cli/app.hpp"

int main(int argc, char** argv) {
    wslgate::cli::App app;
    return app.run(argc, argv);
}
