#include "sseview/app.hpp"

int main(int argc, char *argv[]) {
    sseview::App app;
    return app.run(argc, argv);
}
