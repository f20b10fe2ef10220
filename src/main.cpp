#include "gradia/cli/app.hpp"

int main(int argc, char** argv) {
    gradia::cli::App app;
    return app.run(argc, argv);
}
