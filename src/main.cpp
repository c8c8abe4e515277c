#include "chatbridge/cli/app.hpp"

int main(int argc, char** argv) {
    chatbridge::cli::App app;
    return app.run(argc, argv);
}
