#include <iostream>
#include <cassert>
#include "coordinate_resolver/coordinate_resolver.h"
#include "common/error_handler.h"
#include "common/structured_logger.h"

using namespace calcpilot;

namespace {

ElementDescriptor element(const std::string& id, int left, int top, int width, int height) {
    ElementDescriptor descriptor;
    descriptor.id = id;
    descriptor.label = id;
    descriptor.aliases = {id};
    descriptor.boundingBox = BoundingBox{left, top, width, height};
    return descriptor;
}

} // namespace

void testCentroid() {
    std::cout << "[TEST] Centroid\n";

    CoordinateResolver resolver;
    auto target = resolver.resolve(element("plus", 238, 398, 76, 40), WindowFrame{100, 50, true},
                                   ButtonSymbol::forOperator(Operator::ADD));
    assert(target.x == 100 + 238 + 38);
    assert(target.y == 50 + 398 + 20);
    assert(target.symbol.name == "+");
    assert(target.element.id == "plus");

    // Odd sizes round down
    target = resolver.resolve(element("odd", 10, 20, 7, 5), WindowFrame{3, 4, true});
    assert(target.x == 16);
    assert(target.y == 26);

    // Windows partly off screen keep negative origins
    target = resolver.resolve(element("neg", 0, 0, 10, 10), WindowFrame{-200, -30, true});
    assert(target.x == -195);
    assert(target.y == -25);

    std::cout << "[OK] Centroid test passed\n\n";
}

void testSameInputsSameTarget() {
    std::cout << "[TEST] Same Inputs Same Target\n";

    CoordinateResolver resolver;
    auto equals = element("equals", 238, 440, 76, 40);
    WindowFrame frame{100, 50, true};

    auto first = resolver.resolve(equals, frame, ButtonSymbol::evaluate());
    for (int i = 0; i < 10; ++i) {
        auto again = resolver.resolve(equals, frame, ButtonSymbol::evaluate());
        assert(again.x == first.x);
        assert(again.y == first.y);
    }

    // Only the box and the origin matter
    auto twin = element("n-other", 238, 440, 76, 40);
    twin.label = "Something else";
    twin.aliases = {"other", "twin"};
    auto twinTarget = resolver.resolve(twin, frame, ButtonSymbol::digit(3));
    assert(twinTarget.x == first.x);
    assert(twinTarget.y == first.y);
    assert(twinTarget.element.id == "n-other");

    CoordinateResolver otherResolver;
    auto fromOther = otherResolver.resolve(equals, WindowFrame{100, 50, true});
    assert(fromOther.x == first.x);
    assert(fromOther.y == first.y);

    std::cout << "[OK] Same inputs same target test passed\n\n";
}

void testUnavailableWindow() {
    std::cout << "[TEST] Unavailable Window\n";

    CoordinateResolver resolver;
    auto descriptor = element("seven", 4, 314, 76, 40);

    bool threw = false;
    try {
        resolver.resolve(descriptor, std::nullopt);
    } catch (const WindowUnavailableError& e) {
        threw = true;
        assert(e.getType() == ErrorType::WINDOW_UNAVAILABLE);
        assert(e.getErrorInfo().details == "seven");
    }
    assert(threw);

    threw = false;
    try {
        resolver.resolve(descriptor, WindowFrame{0, 0, false});
    } catch (const WindowUnavailableError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[OK] Unavailable window test passed\n\n";
}

int main() {
    std::cout << "=== CalcPilot Coordinate Resolver Test Suite ===\n\n";

    StructuredLogger::getInstance().setLogLevel(LogLevel::CRITICAL);

    try {
        testCentroid();
        testSameInputsSameTarget();
        testUnavailableWindow();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
