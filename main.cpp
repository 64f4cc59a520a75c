#include "app/MetricLensApp.hpp"

int main(int argc, char** argv) {
    metriclens::app::MetricLensApp app;
    return app.Run(argc, argv);
}
