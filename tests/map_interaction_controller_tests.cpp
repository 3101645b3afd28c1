#include "app/map_interaction_controller.h"

#include "recording_surface.h"

#include <gtest/gtest.h>

#include <vector>

using namespace slippymap;
using slippymap::testing::RecordingSurfaceFactory;
using mapinteraction::Gesture;
using mapinteraction::MouseMode;

namespace {

struct ViewFixture {
    RecordingSurfaceFactory factory;
    MapView view{factory};
    std::vector<GeoRect> selections;
    int invalidations = 0;

    // 600x400 view at zoom 5 scrolled to (1000, 1000).
    ViewFixture() {
        view.set_viewport_size({600, 400});
        view.set_zoom(5);
        view.scroll_to(1000, 1000);
        view.handlers().selection_box = [this](MapView&, const GeoRect& rect) { selections.push_back(rect); };
        view.handlers().invalidate = [this] { ++invalidations; };
    }
};

}  // namespace

TEST(MapInteractionControllerTest, DragPansMap) {
    ViewFixture f;
    MapInteractionController controller(f.view);

    controller.press({100, 100});
    EXPECT_EQ(controller.gesture(), Gesture::Pan);

    controller.motion({80, 90});
    EXPECT_EQ(f.view.scroll_position(), (Point{1020, 1010}));

    controller.release({70, 90});
    EXPECT_EQ(f.view.scroll_position(), (Point{1030, 1010}));
    EXPECT_EQ(controller.gesture(), Gesture::None);

    controller.motion({0, 0});
    EXPECT_EQ(f.view.scroll_position(), (Point{1030, 1010}));
    EXPECT_TRUE(f.selections.empty());
}

TEST(MapInteractionControllerTest, PressOnMarkDoesNotPan) {
    ViewFixture f;
    f.view.map_marks().add(f.view.map_to_geo(Point{1100, 1100}), "mark", 0);
    MapInteractionController controller(f.view);

    controller.press({100, 100});
    EXPECT_EQ(controller.gesture(), Gesture::None);
    controller.motion({50, 50});
    controller.release({50, 50});
    EXPECT_EQ(f.view.scroll_position(), (Point{1000, 1000}));
}

TEST(MapInteractionControllerTest, PressOutsideMapStartsNothing) {
    RecordingSurfaceFactory factory;
    MapView view(factory);
    view.set_viewport_size({600, 400});
    ASSERT_EQ(view.zoom(), 0);

    MapInteractionController controller(view);
    controller.press({300, 100});
    EXPECT_EQ(controller.gesture(), Gesture::None);

    controller.set_mouse_mode(MouseMode::Select);
    controller.press({100, 300});
    EXPECT_EQ(controller.gesture(), Gesture::None);
    EXPECT_FALSE(controller.selection_rect().has_value());
}

TEST(MapInteractionControllerTest, SelectReportsNormalizedRect) {
    ViewFixture f;
    MapInteractionController controller(f.view);
    controller.set_mouse_mode(MouseMode::Select);

    controller.press({100, 100});
    EXPECT_EQ(controller.gesture(), Gesture::Select);
    controller.motion({50, 20});
    ASSERT_TRUE(controller.selection_rect().has_value());
    EXPECT_EQ(*controller.selection_rect(), (Rect{50, 20, 100, 100}));
    EXPECT_GT(f.invalidations, 0);

    controller.release({50, 20});
    EXPECT_EQ(controller.gesture(), Gesture::None);
    EXPECT_FALSE(controller.selection_rect().has_value());
    EXPECT_EQ(f.view.scroll_position(), (Point{1000, 1000}));

    ASSERT_EQ(f.selections.size(), 1u);
    const GeoRect expected = map_to_geo(5, Rect{1050, 1020, 1100, 1100});
    EXPECT_EQ(f.selections[0].top_left, expected.top_left);
    EXPECT_EQ(f.selections[0].bottom_right, expected.bottom_right);
}

TEST(MapInteractionControllerTest, SelectionIsClampedToMap) {
    ViewFixture f;
    f.view.scroll_to(100000, 100000);
    ASSERT_EQ(f.view.scroll_position(), (Point{7592, 7792}));

    MapInteractionController controller(f.view);
    controller.set_mouse_mode(MouseMode::Select);
    controller.press({500, 300});
    controller.motion({700, 500});
    ASSERT_TRUE(controller.selection_rect().has_value());
    EXPECT_EQ(*controller.selection_rect(), (Rect{500, 300, 600, 400}));

    controller.release({700, 500});
    ASSERT_EQ(f.selections.size(), 1u);
    const GeoRect expected = map_to_geo(5, Rect{8092, 8092, 8192, 8192});
    EXPECT_EQ(f.selections[0].top_left, expected.top_left);
    EXPECT_EQ(f.selections[0].bottom_right, expected.bottom_right);
}

TEST(MapInteractionControllerTest, EscapeCancelsSelection) {
    ViewFixture f;
    MapInteractionController controller(f.view);
    EXPECT_FALSE(controller.cancel());

    controller.set_mouse_mode(MouseMode::Select);
    controller.press({100, 100});
    controller.motion({200, 150});
    EXPECT_TRUE(controller.cancel());
    EXPECT_EQ(controller.gesture(), Gesture::None);

    controller.release({200, 150});
    EXPECT_TRUE(f.selections.empty());
}

TEST(MapInteractionControllerTest, ModeChangeDropsGesture) {
    ViewFixture f;
    MapInteractionController controller(f.view);
    controller.set_mouse_mode(MouseMode::Select);
    controller.press({100, 100});

    controller.set_mouse_mode(MouseMode::Drag);
    EXPECT_EQ(controller.gesture(), Gesture::None);
    controller.release({150, 150});
    EXPECT_TRUE(f.selections.empty());
    EXPECT_EQ(f.view.scroll_position(), (Point{1000, 1000}));
}

TEST(MapInteractionControllerTest, WheelZoomsAtCursor) {
    ViewFixture f;
    MapInteractionController controller(f.view);

    controller.wheel({100, 100}, 1.0);
    EXPECT_EQ(f.view.zoom(), 6);
    EXPECT_NEAR(f.view.scroll_position().x, 2100, 1);
    EXPECT_NEAR(f.view.scroll_position().y, 2100, 1);

    controller.wheel({100, 100}, -3.5);
    EXPECT_EQ(f.view.zoom(), 5);
    EXPECT_NEAR(f.view.scroll_position().x, 1000, 1);
    EXPECT_NEAR(f.view.scroll_position().y, 1000, 1);

    controller.wheel({100, 100}, 0.0);
    EXPECT_EQ(f.view.zoom(), 5);
}

TEST(MapInteractionControllerTest, WheelOutsideMapAnchorsAtMapEdge) {
    RecordingSurfaceFactory factory;
    MapView view(factory);
    view.set_viewport_size({600, 400});

    MapInteractionController controller(view);
    controller.wheel({500, 300}, -1.0);
    EXPECT_EQ(view.zoom(), 0);

    controller.wheel({500, 300}, 1.0);
    EXPECT_EQ(view.zoom(), 1);
    // 512 px map: only the vertical axis can scroll
    EXPECT_EQ(view.scroll_range(), (Point{0, 112}));
    EXPECT_EQ(view.scroll_position(), (Point{0, 112}));
}
