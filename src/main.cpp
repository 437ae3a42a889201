#include "app.h"

int main(int argc, char** argv) {
    rls::App app;
    return app.run(argc, argv);
}
