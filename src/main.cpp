#include "gui/GuiApplication.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

// tripscope_viewer [log.csv] [--month-first]
int main(int argc, char** argv) {
    std::string initialLog;
    bool monthFirst = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--month-first") {
            monthFirst = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: tripscope_viewer [log.csv] [--month-first]\n";
            return EXIT_SUCCESS;
        } else if (initialLog.empty()) {
            initialLog = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << '\n';
            return EXIT_FAILURE;
        }
    }

    try {
        tripscope::gui::GuiApplication app;
        if (monthFirst) {
            app.setMonthFirst(true);
        }
        if (!initialLog.empty() && !app.openLog(initialLog)) {
            std::cerr << "Viewer: " << app.sessionStatus() << '\n';
        }
        app.run();
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << '\n';
    }
    return EXIT_FAILURE;
}
