#include "app/GlucoseTrailApp.hpp"

int main(int argc, char** argv) {
    glucosetrail::app::GlucoseTrailApp app;
    return app.Run(argc, argv);
}
