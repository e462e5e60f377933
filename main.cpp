#include "app/NodeForgeApp.hpp"

int main(int argc, char** argv) {
    nodeforge::app::NodeForgeApp app;
    return app.Run(argc, argv);
}
