#include "structree/app.hpp"

int main(int argc, char** argv) {
    structree::App app;
    return app.run(argc, argv);
}
