// tests/input_bindings_tests.cpp

#include <doctest/doctest.h>

#include <fstream>

#include <GLFW/glfw3.h>

#include "engine/platform/ActionBindings.hpp"
#include "engine/platform/Input.hpp"
#include "test_support/TestWorld.hpp"

using engine::platform::ActionBinding;
using engine::platform::ActionBindings;
using engine::platform::Input;
using engine::platform::InputAction;

TEST_SUITE("Input") {

TEST_CASE("Pressed fires on the first frame a key is down") {
    Input input;
    input.BeginFrame();
    input.SetKeyState(GLFW_KEY_Q, true);
    CHECK(input.IsKeyDown(GLFW_KEY_Q));
    CHECK(input.IsKeyPressed(GLFW_KEY_Q));

    input.BeginFrame();
    CHECK(input.IsKeyDown(GLFW_KEY_Q));
    CHECK_FALSE(input.IsKeyPressed(GLFW_KEY_Q));

    input.BeginFrame();
    input.SetKeyState(GLFW_KEY_Q, false);
    CHECK(input.IsKeyReleased(GLFW_KEY_Q));
}

TEST_CASE("Out of range keys read as up") {
    Input input;
    input.SetKeyState(-1, true);
    input.SetKeyState(Input::kMaxKeys, true);
    CHECK_FALSE(input.IsKeyDown(-1));
    CHECK_FALSE(input.IsKeyPressed(Input::kMaxKeys));
}

} // TEST_SUITE

TEST_SUITE("ActionBindings") {

TEST_CASE("Either slot drives an action") {
    const ActionBindings bindings;
    Input input;

    input.BeginFrame();
    input.SetKeyState(GLFW_KEY_LEFT, true);
    CHECK(bindings.IsDown(input, InputAction::MoveLeft));
    CHECK(bindings.IsPressed(input, InputAction::MoveLeft));
    CHECK_FALSE(bindings.IsDown(input, InputAction::MoveRight));

    input.BeginFrame();
    input.SetKeyState(GLFW_KEY_A, true);
    CHECK(bindings.IsDown(input, InputAction::MoveLeft));
    CHECK(bindings.IsPressed(input, InputAction::MoveLeft));
}

TEST_CASE("Default keys") {
    const ActionBindings bindings;
    CHECK(bindings.GetCode(InputAction::Jump, 0) == GLFW_KEY_SPACE);
    CHECK(bindings.GetCode(InputAction::CycleSeason, 0) == GLFW_KEY_Q);
    CHECK(bindings.GetCode(InputAction::RestartRun, 0) == GLFW_KEY_R);
    CHECK(bindings.GetCode(InputAction::Quit, 0) == GLFW_KEY_ESCAPE);
    CHECK(ActionBindings::CodeToLabel(GLFW_KEY_R) == "R");
    CHECK(ActionBindings::CodeToLabel(ActionBindings::kUnbound) == "Unbound");
}

TEST_CASE("FindConflict reports the other action using a key") {
    const ActionBindings bindings;
    const auto conflict = bindings.FindConflict(GLFW_KEY_Q, InputAction::Jump, 0);
    REQUIRE(conflict.has_value());
    CHECK(conflict->first == InputAction::CycleSeason);
    CHECK(conflict->second == 0);
    CHECK_FALSE(bindings.FindConflict(GLFW_KEY_Q, InputAction::CycleSeason, 0).has_value());
}

TEST_CASE("Bindings survive a save and reload") {
    const testsupport::TempFile file("controls");
    ActionBindings saved;
    saved.SetCode(InputAction::CycleSeason, 0, GLFW_KEY_TAB);
    saved.SetCode(InputAction::Jump, 1, GLFW_KEY_W);
    REQUIRE(saved.SaveToJsonFile(file.Path()));

    ActionBindings loaded;
    std::string error;
    REQUIRE(loaded.LoadFromJsonFile(file.Path(), &error));
    CHECK(loaded.GetCode(InputAction::CycleSeason, 0) == GLFW_KEY_TAB);
    CHECK(loaded.GetCode(InputAction::Jump, 1) == GLFW_KEY_W);
    CHECK(loaded.GetCode(InputAction::MoveRight, 0) == GLFW_KEY_D);
}

TEST_CASE("A controls file without bindings is rejected") {
    const testsupport::TempFile file("bad_controls");
    std::ofstream(file.Path()) << R"({"asset_version":1})";

    ActionBindings bindings;
    std::string error;
    CHECK_FALSE(bindings.LoadFromJsonFile(file.Path(), &error));
    CHECK_FALSE(error.empty());
}

} // TEST_SUITE
