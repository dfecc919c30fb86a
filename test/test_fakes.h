#ifndef CALCPILOT_TEST_FAKES_H
#define CALCPILOT_TEST_FAKES_H

#include <vector>
#include <utility>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.h"
#include "element_registry/element_registry.h"
#include "ocal/window_locator.h"
#include "ocal/click_primitive.h"

namespace calcpilot {
namespace testing {

// Scriptable window: a queue of frames returned by successive getFrame() calls
class FakeWindowLocator : public ocal::IWindowLocator {
public:
    std::vector<std::optional<WindowFrame>> frames;
    std::optional<WindowFrame> frameAfterOpen;
    bool focusResult = true;
    int frameCalls = 0;
    int openCalls = 0;
    int focusCalls = 0;

    explicit FakeWindowLocator(std::optional<WindowFrame> initial = WindowFrame{100, 50, true}) {
        frames.push_back(initial);
    }

    std::optional<WindowFrame> getFrame() override {
        size_t index = static_cast<size_t>(frameCalls);
        ++frameCalls;
        return index < frames.size() ? frames[index] : frames.back();
    }

    void ensureOpen() override {
        ++openCalls;
        if (frameAfterOpen) {
            frames.assign(1, frameAfterOpen);
            frameCalls = 0;
        }
    }

    bool focus() override {
        ++focusCalls;
        return focusResult;
    }
};

class RecordingClicker : public ocal::IClickPrimitive {
public:
    std::vector<std::pair<int, int>> clicks;
    int failAt = -1;

    ClickResult click(int x, int y) override {
        if (static_cast<int>(clicks.size()) == failAt) {
            failAt = -1;
            return ClickResult::failed("injected failure");
        }
        clicks.emplace_back(x, y);
        return ClickResult::ok();
    }
};

inline nlohmann::json registryNode(const std::string& icon, const std::string& brief,
                                   int x1, int y1, int x2, int y2) {
    return nlohmann::json{{"g_icon_name", icon}, {"g_brief", brief}, {"bbox", {x1, y1, x2, y2}}};
}

// Digits, the four operators, "=", square, square root and clear
inline std::shared_ptr<const ElementRegistry> sampleRegistry() {
    nlohmann::json nodes = {
        {"d0", registryNode("0 Button", "Zero", 82, 440, 158, 480)},
        {"d1", registryNode("1 Button", "One", 4, 398, 80, 438)},
        {"d2", registryNode("2 Button", "Two", 82, 398, 158, 438)},
        {"d3", registryNode("3 Button", "Three", 160, 398, 236, 438)},
        {"d4", registryNode("4 Button", "Four", 4, 356, 80, 396)},
        {"plus", registryNode("+ Button", "Plus", 238, 398, 314, 438)},
        {"minus", registryNode("- Button", "Minus", 238, 356, 314, 396)},
        {"times", registryNode("× Button", "Multiply by", 238, 314, 314, 354)},
        {"divide", registryNode("÷ Button", "Divide by", 238, 272, 314, 312)},
        {"equals", registryNode("= Button", "Equals", 238, 440, 314, 480)},
        {"square", registryNode("x² Button", "Square", 82, 272, 158, 312)},
        {"sqrt", registryNode("√x Button", "Square root", 160, 272, 236, 312)},
        {"clear", registryNode("C Button", "Clear", 160, 230, 236, 270)}
    };
    return ElementRegistry::fromJson({{"states", {{"root", {{"nodes", nodes}}}}}}, "root");
}

} // namespace testing
} // namespace calcpilot

#endif // CALCPILOT_TEST_FAKES_H
