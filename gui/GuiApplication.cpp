#include "GuiApplication.hpp"

#include "report_format.hpp"

#include <GL/glew.h>
#include <GLFW/glfw3.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <imgui.h>
#include <misc/cpp/imgui_stdlib.h>
#include <utility>
#include <stdexcept>
#include <string>

#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>

namespace tripscope::gui {

namespace {

constexpr float kMargin = 48.0f;

void glfwErrorCallback(int error, const char* description) {
    std::fprintf(stderr, "GLFW Error %d: %s\n", error, description);
}

ImVec2 mapToCanvas(const Point2D& point, const ImVec2& origin, const ImVec2& size, const PlotBounds& bounds) {
    float xNorm = static_cast<float>((point.x - bounds.minX) / (bounds.maxX - bounds.minX));
    float yNorm = static_cast<float>((point.y - bounds.minY) / (bounds.maxY - bounds.minY));
    xNorm = std::clamp(xNorm, 0.0f, 1.0f);
    yNorm = std::clamp(yNorm, 0.0f, 1.0f);

    float x = origin.x + xNorm * size.x;
    float y = origin.y + (1.0f - yNorm) * size.y;
    return ImVec2{x, y};
}

struct PlotSeries {
    const std::vector<Point2D>* points;
    ImU32 color;
    bool markers;
};

// Axes, grid, tick labels and the given series on the remaining window area.
void drawPlotCanvas(const std::vector<PlotSeries>& series, const PlotBounds& bounds, int tickCount,
                    const char* xLabel, const char* yLabel) {
    ImVec2 windowPos = ImGui::GetCursorScreenPos();
    ImVec2 windowSize = ImGui::GetContentRegionAvail();
    if (windowSize.x < 160.0f) windowSize.x = 160.0f;
    if (windowSize.y < 120.0f) windowSize.y = 120.0f;

    ImDrawList* drawList = ImGui::GetWindowDrawList();
    ImVec2 windowEnd{windowPos.x + windowSize.x, windowPos.y + windowSize.y};
    drawList->AddRectFilled(windowPos, windowEnd, IM_COL32(30, 30, 35, 255));

    ImVec2 canvasPos{windowPos.x + kMargin, windowPos.y + 12.0f};
    ImVec2 canvasSize{windowSize.x - kMargin - 12.0f, windowSize.y - kMargin - 12.0f};
    ImVec2 canvasEnd{canvasPos.x + canvasSize.x, canvasPos.y + canvasSize.y};
    drawList->AddRect(canvasPos, canvasEnd, IM_COL32(80, 80, 90, 255));

    int ticks = std::max(2, tickCount);
    ImU32 gridColor = IM_COL32(60, 60, 70, 120);
    ImU32 tickColor = IM_COL32(160, 160, 180, 200);
    float fontSize = ImGui::GetFontSize();

    for (int i = 0; i <= ticks; ++i) {
        double fx = bounds.minX + (bounds.maxX - bounds.minX) * i / ticks;
        double fy = bounds.minY + (bounds.maxY - bounds.minY) * i / ticks;

        ImVec2 vx = mapToCanvas(Point2D{fx, bounds.minY}, canvasPos, canvasSize, bounds);
        drawList->AddLine(ImVec2{vx.x, canvasPos.y}, ImVec2{vx.x, canvasEnd.y}, gridColor);
        ImVec2 hy = mapToCanvas(Point2D{bounds.minX, fy}, canvasPos, canvasSize, bounds);
        drawList->AddLine(ImVec2{canvasPos.x, hy.y}, ImVec2{canvasEnd.x, hy.y}, gridColor);

        char label[32];
        std::snprintf(label, sizeof(label), "%0.2f", fx);
        drawList->AddText(ImVec2{vx.x - fontSize, canvasEnd.y + 4.0f}, tickColor, label);
        std::snprintf(label, sizeof(label), "%0.1f", fy);
        drawList->AddText(ImVec2{windowPos.x + 4.0f, hy.y - fontSize * 0.5f}, tickColor, label);
    }

    drawList->AddText(ImVec2{canvasEnd.x - 140.0f, canvasEnd.y + fontSize + 6.0f}, tickColor, xLabel);
    drawList->AddText(ImVec2{canvasPos.x + 6.0f, canvasPos.y + 4.0f}, tickColor, yLabel);

    drawList->PushClipRect(canvasPos, canvasEnd, true);
    for (const auto& s : series) {
        const auto& pts = *s.points;
        if (s.markers) {
            for (const auto& p : pts) {
                drawList->AddCircleFilled(mapToCanvas(p, canvasPos, canvasSize, bounds), 4.0f, s.color, 10);
            }
            continue;
        }
        for (std::size_t i = 1; i < pts.size(); ++i) {
            drawList->AddLine(mapToCanvas(pts[i - 1], canvasPos, canvasSize, bounds),
                              mapToCanvas(pts[i], canvasPos, canvasSize, bounds), s.color, 1.5f);
        }
    }
    drawList->PopClipRect();

    ImGui::Dummy(windowSize);
}

}  // namespace

GuiApplication::GuiApplication() {
    initWindow();
    initImGui();
}

GuiApplication::~GuiApplication() {
    shutdown();
}

void GuiApplication::initWindow() {
    glfwSetErrorCallback(glfwErrorCallback);
    if (!glfwInit()) {
        throw std::runtime_error("Failed to initialize GLFW");
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#ifdef __APPLE__
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
#endif

    window_ = glfwCreateWindow(1400, 860, "Trip Telemetry Viewer", nullptr, nullptr);
    if (!window_) {
        glfwTerminate();
        throw std::runtime_error("Failed to create GLFW window");
    }

    glfwMakeContextCurrent(window_);
    glfwSwapInterval(1);

    glewExperimental = GL_TRUE;
    GLenum glewStatus = glewInit();
    if (glewStatus != GLEW_OK) {
        std::string message = "Failed to initialize GLEW: ";
        message += reinterpret_cast<const char*>(glewGetErrorString(glewStatus));
        glfwDestroyWindow(window_);
        window_ = nullptr;
        glfwTerminate();
        throw std::runtime_error(message);
    }

    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
}

void GuiApplication::initImGui() {
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui::StyleColorsDark();

    ImGui_ImplGlfw_InitForOpenGL(window_, true);
    ImGui_ImplOpenGL3_Init("#version 150");
}

void GuiApplication::shutdown() {
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    if (window_) {
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
    glfwTerminate();
}

void GuiApplication::run() {
    while (!glfwWindowShouldClose(window_) && !shouldClose_) {
        glfwPollEvents();

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        drawControls();
        drawParameters();
        drawSummary();
        drawSpeedTime();
        drawSpeedDistance();
        drawProfiles();

        ImGui::Render();
        int display_w = 0;
        int display_h = 0;
        glfwGetFramebufferSize(window_, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        glClearColor(0.08f, 0.08f, 0.10f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(window_);
    }
}

bool GuiApplication::openLog(const std::string& path) {
    logPath_ = path;
    selectedProfile_ = 0;
    return session_.load(path);
}

void GuiApplication::setMonthFirst(bool monthFirst) {
    monthFirst_ = monthFirst;
    AnalysisConfig config = session_.config();
    config.dateRules.order = monthFirst ? DateOrder::MonthFirst : DateOrder::DayFirst;
    session_.setConfig(config);
}

void GuiApplication::drawControls() {
    ImGui::Begin("Trip Log");

    ImGui::InputText("Log File (CSV)", &logPath_);
    ImGui::InputText("Delimiter (empty = detect)", &delimiter_);
    if (ImGui::Button("Load")) {
        TableReadOptions options = session_.readOptions();
        options.delimiter = delimiter_ == "tab" ? '\t' : (delimiter_.size() == 1 ? delimiter_[0] : '\0');
        session_.setReadOptions(options);
        if (session_.load(logPath_)) {
            selectedProfile_ = 0;
        }
        exportStatus_.clear();
    }
    ImGui::SameLine();
    if (ImGui::Button("Clear")) {
        session_.clear();
        exportStatus_.clear();
    }
    if (!session_.status().empty()) {
        ImGui::TextWrapped("%s", session_.status().c_str());
    }

    ImGui::Separator();

    int ticks = tickCount_;
    if (ImGui::InputInt("Tick Count", &ticks)) {
        tickCount_ = std::max(2, ticks);
    }

    ImGui::InputText("SVG Output File", &exportPath_);
    if (ImGui::Button("Export Speed/Distance SVG")) {
        if (exportSvg(exportPath_)) {
            exportStatus_ = "Exported SVG to " + exportPath_;
        } else {
            exportStatus_ = "Failed to export SVG";
        }
    }
    if (!exportStatus_.empty()) {
        ImGui::TextWrapped("%s", exportStatus_.c_str());
    }

    ImGui::End();
}

void GuiApplication::drawParameters() {
    ImGui::Begin("Parameters");

    AnalysisConfig config = session_.config();
    bool changed = false;

    if (ImGui::Button("Summary offsets (50, 100 m)")) {
        config.proximityOffsetsMeters = AnalysisConfig::summaryPreset().proximityOffsetsMeters;
        changed = true;
    }
    ImGui::SameLine();
    if (ImGui::Button("Deceleration offsets (1, 10, 50, 100 m)")) {
        config.proximityOffsetsMeters = AnalysisConfig::decelerationPreset().proximityOffsetsMeters;
        changed = true;
    }

    std::string offsets;
    for (int offset : config.proximityOffsetsMeters) {
        offsets += (offsets.empty() ? "" : ", ") + std::to_string(offset) + " m";
    }
    ImGui::Text("Proximity offsets: %s", offsets.c_str());

    float windowKm = static_cast<float>(config.decelerationWindowKm);
    if (ImGui::SliderFloat("Deceleration Window (km)", &windowKm, 0.1f, 5.0f, "%.2f")) {
        config.decelerationWindowKm = windowKm;
        changed = true;
    }

    float bucket = static_cast<float>(config.resampleIntervalSeconds);
    if (ImGui::SliderFloat("Resample Interval (s)", &bucket, 1.0f, 300.0f, "%.0f")) {
        config.resampleIntervalSeconds = bucket;
        changed = true;
    }

    if (ImGui::Checkbox("Month-first dates", &monthFirst_)) {
        config.dateRules.order = monthFirst_ ? DateOrder::MonthFirst : DateOrder::DayFirst;
        changed = true;
    }

    if (changed) {
        session_.setConfig(config);
        selectedProfile_ = 0;
    }

    ImGui::End();
}

void GuiApplication::drawSummary() {
    ImGui::Begin("Trip Summary");

    if (!session_.hasResult()) {
        ImGui::TextWrapped("Load a telemetry log to see the analysis.");
        ImGui::End();
        return;
    }

    const auto& result = session_.result();
    DisplayMetrics display = formatMetrics(result.metrics);
    ImGui::Text("Total Distance: %s", display.totalDistance.c_str());
    ImGui::Text("Max Speed: %s %s", display.maxSpeed.c_str(), display.maxSpeedDetails.c_str());
    ImGui::Text("Samples: %zu (data from row %zu)", result.series.size(), result.dataStartRow);

    ImGui::Separator();
    ImGui::Text("Stop Analysis");
    std::vector<std::string> lines = formatStopAnalysis(result.stops);
    if (lines.empty()) {
        ImGui::TextWrapped("No stops detected.");
    }
    for (const auto& line : lines) {
        ImGui::TextUnformatted(line.c_str());
    }

    ImGui::End();
}

void GuiApplication::drawSpeedTime() {
    ImGui::Begin("Speed vs. Time");
    const auto& points = session_.speedOverTime();
    std::vector<PlotSeries> series{{&points, IM_COL32(80, 160, 255, 230), false}};
    drawPlotCanvas(series, TripSession::boundsOf(points), tickCount_, "Time [s]", "Speed [Kmph]");
    ImGui::End();
}

void GuiApplication::drawSpeedDistance() {
    ImGui::Begin("Speed vs. Cumulative Distance");
    const auto& points = session_.speedOverDistance();
    std::vector<PlotSeries> series{{&points, IM_COL32(80, 160, 255, 230), false},
                                   {&session_.proximityMarkers(), IM_COL32(255, 80, 80, 240), true}};
    drawPlotCanvas(series, TripSession::boundsOf(points), tickCount_, "Distance [km]", "Speed [Kmph]");
    ImGui::End();
}

void GuiApplication::drawProfiles() {
    ImGui::Begin("Deceleration Profiles");

    if (!session_.hasResult() || session_.result().decelerationProfiles.empty()) {
        ImGui::TextWrapped("No stops to profile.");
        ImGui::End();
        return;
    }

    const auto& profiles = session_.result().decelerationProfiles;
    selectedProfile_ = std::clamp(selectedProfile_, 0, static_cast<int>(profiles.size()) - 1);
    std::string current = profileName(profiles[static_cast<std::size_t>(selectedProfile_)]);
    if (ImGui::BeginCombo("Stop", current.c_str())) {
        for (std::size_t i = 0; i < profiles.size(); ++i) {
            bool selected = static_cast<int>(i) == selectedProfile_;
            std::string label = profileName(profiles[i]) + "##" + std::to_string(i);
            if (ImGui::Selectable(label.c_str(), selected)) {
                selectedProfile_ = static_cast<int>(i);
            }
        }
        ImGui::EndCombo();
    }
    ImGui::SameLine();
    ImGui::Checkbox("Overlay all", &overlayProfiles_);

    std::vector<std::vector<Point2D>> curves;
    if (overlayProfiles_) {
        for (std::size_t i = 0; i < profiles.size(); ++i) {
            curves.push_back(session_.profilePoints(i));
        }
    } else {
        curves.push_back(session_.profilePoints(static_cast<std::size_t>(selectedProfile_)));
    }

    std::vector<Point2D> all;
    std::vector<PlotSeries> series;
    for (std::size_t i = 0; i < curves.size(); ++i) {
        all.insert(all.end(), curves[i].begin(), curves[i].end());
        float hue = curves.size() > 1 ? static_cast<float>(i) / static_cast<float>(curves.size()) : 0.08f;
        ImVec4 rgb;
        ImGui::ColorConvertHSVtoRGB(hue, 0.65f, 1.0f, rgb.x, rgb.y, rgb.z);
        series.push_back(PlotSeries{&curves[i], ImGui::ColorConvertFloat4ToU32(ImVec4{rgb.x, rgb.y, rgb.z, 0.9f}), false});
    }
    drawPlotCanvas(series, TripSession::boundsOf(all), tickCount_, "Distance before stop [m]", "Speed [Kmph]");

    ImGui::End();
}

bool GuiApplication::exportSvg(const std::string& path) const {
    const auto& points = session_.speedOverDistance();
    if (points.empty()) {
        return false;
    }
    std::ofstream svg(path);
    if (!svg.is_open()) {
        return false;
    }

    const float width = 1000.0f;
    const float height = 600.0f;
    const float margin = 70.0f;
    PlotBounds bounds = TripSession::boundsOf(points);
    int ticks = std::max(2, tickCount_);

    auto mapPoint = [&](const Point2D& pt) {
        float xNorm = static_cast<float>((pt.x - bounds.minX) / (bounds.maxX - bounds.minX));
        float yNorm = static_cast<float>((pt.y - bounds.minY) / (bounds.maxY - bounds.minY));
        float x = margin + xNorm * (width - 2.0f * margin);
        float y = height - (margin + yNorm * (height - 2.0f * margin));
        return std::pair<float, float>{x, y};
    };

    svg << "<svg xmlns='http://www.w3.org/2000/svg' width='" << width << "' height='" << height
        << "' viewBox='0 0 " << width << ' ' << height << "'>\n";
    svg << "  <rect x='0' y='0' width='" << width << "' height='" << height << "' fill='#1e1e23' />\n";
    svg << "  <text x='" << margin << "' y='" << (margin - 30.0f)
        << "' fill='#d0d0df' font-family='sans-serif' font-size='20'>Speed vs. Cumulative Distance</text>\n";

    for (int i = 0; i <= ticks; ++i) {
        double fx = bounds.minX + (bounds.maxX - bounds.minX) * i / ticks;
        double fy = bounds.minY + (bounds.maxY - bounds.minY) * i / ticks;
        auto vx0 = mapPoint(Point2D{fx, bounds.minY});
        auto vx1 = mapPoint(Point2D{fx, bounds.maxY});
        svg << "  <line x1='" << vx0.first << "' y1='" << vx0.second << "' x2='" << vx1.first << "' y2='" << vx1.second
            << "' stroke='#3e3e46' stroke-width='1' />\n";
        auto hy0 = mapPoint(Point2D{bounds.minX, fy});
        auto hy1 = mapPoint(Point2D{bounds.maxX, fy});
        svg << "  <line x1='" << hy0.first << "' y1='" << hy0.second << "' x2='" << hy1.first << "' y2='" << hy1.second
            << "' stroke='#3e3e46' stroke-width='1' />\n";

        char label[32];
        std::snprintf(label, sizeof(label), "%0.2f", fx);
        svg << "  <text x='" << (vx0.first - 14.0f) << "' y='" << (vx0.second + 20.0f)
            << "' fill='#c0c0cf' font-family='sans-serif' font-size='13'>" << label << "</text>\n";
        std::snprintf(label, sizeof(label), "%0.1f", fy);
        svg << "  <text x='" << (hy0.first - 44.0f) << "' y='" << (hy0.second + 4.0f)
            << "' fill='#c0c0cf' font-family='sans-serif' font-size='13'>" << label << "</text>\n";
    }

    svg << "  <text x='" << (width - margin - 140.0f) << "' y='" << (height - 20.0f)
        << "' fill='#d0d0df' font-family='sans-serif' font-size='16'>Cumulative Distance (Km)</text>\n";
    svg << "  <text x='10' y='" << (margin - 8.0f)
        << "' fill='#d0d0df' font-family='sans-serif' font-size='16'>Speed (Kmph)</text>\n";

    svg << "  <polyline fill='none' stroke='#50a0ff' stroke-width='1.5' points='";
    for (const auto& point : points) {
        auto [x, y] = mapPoint(point);
        svg << x << ',' << y << ' ';
    }
    svg << "' />\n";

    const auto& markers = session_.proximityMarkers();
    if (!markers.empty()) {
        svg << "  <g fill='#ff3030'>\n";
        for (const auto& point : markers) {
            auto [x, y] = mapPoint(point);
            svg << "    <circle cx='" << x << "' cy='" << y << "' r='4' />\n";
        }
        svg << "  </g>\n";
    }

    svg << "</svg>\n";
    return true;
}

}  // namespace tripscope::gui
