#include "dotsweep/app.h"

int main(int argc, char** argv) {
    dotsweep::App app;
    return app.run(argc, argv);
}
