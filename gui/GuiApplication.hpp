#pragma once

#include "TripSession.hpp"

#include <string>
#include <vector>

struct GLFWwindow;

namespace tripscope::gui {

class GuiApplication {
public:
    GuiApplication();
    ~GuiApplication();

    GuiApplication(const GuiApplication&) = delete;
    GuiApplication& operator=(const GuiApplication&) = delete;

    void run();

    // Loads a log before the first frame; false when the analysis failed.
    bool openLog(const std::string& path);
    void setMonthFirst(bool monthFirst);
    const std::string& sessionStatus() const { return session_.status(); }

private:
    void initWindow();
    void initImGui();
    void shutdown();

    void drawControls();
    void drawParameters();
    void drawSummary();
    void drawSpeedTime();
    void drawSpeedDistance();
    void drawProfiles();
    bool exportSvg(const std::string& path) const;

    GLFWwindow* window_{nullptr};
    TripSession session_;
    bool shouldClose_{false};

    int tickCount_{6};
    std::string logPath_;
    std::string delimiter_;
    bool monthFirst_{false};
    std::string exportPath_{"speed_distance.svg"};
    std::string exportStatus_;
    int selectedProfile_{0};
    bool overlayProfiles_{false};
};

}  // namespace tripscope::gui
