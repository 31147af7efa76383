#include <gtest/gtest.h>

#include "snake_input.h"
#ifdef __APPLE__
#include <SDL.h>
#else
#include <SDL2/SDL.h>
#endif

#include <string>

TEST(InputMappingTest, ArrowsAndWasdMove) {
    EXPECT_EQ(mapKeyboardKey(SDLK_UP), InputAction::MOVE_UP);
    EXPECT_EQ(mapKeyboardKey(SDLK_w), InputAction::MOVE_UP);
    EXPECT_EQ(mapKeyboardKey(SDLK_DOWN), InputAction::MOVE_DOWN);
    EXPECT_EQ(mapKeyboardKey(SDLK_s), InputAction::MOVE_DOWN);
    EXPECT_EQ(mapKeyboardKey(SDLK_LEFT), InputAction::MOVE_LEFT);
    EXPECT_EQ(mapKeyboardKey(SDLK_a), InputAction::MOVE_LEFT);
    EXPECT_EQ(mapKeyboardKey(SDLK_RIGHT), InputAction::MOVE_RIGHT);
    EXPECT_EQ(mapKeyboardKey(SDLK_d), InputAction::MOVE_RIGHT);
}

TEST(InputMappingTest, ControlKeys) {
    EXPECT_EQ(mapKeyboardKey(SDLK_RETURN), InputAction::CONFIRM);
    EXPECT_EQ(mapKeyboardKey(SDLK_KP_ENTER), InputAction::CONFIRM);
    EXPECT_EQ(mapKeyboardKey(SDLK_r), InputAction::RESET);
    EXPECT_EQ(mapKeyboardKey(SDLK_SPACE), InputAction::PAUSE);
    EXPECT_EQ(mapKeyboardKey(SDLK_EQUALS), InputAction::SPEED_UP);
    EXPECT_EQ(mapKeyboardKey(SDLK_KP_PLUS), InputAction::SPEED_UP);
    EXPECT_EQ(mapKeyboardKey(SDLK_MINUS), InputAction::SPEED_DOWN);
    EXPECT_EQ(mapKeyboardKey(SDLK_ESCAPE), InputAction::QUIT);
    EXPECT_EQ(mapKeyboardKey(SDLK_q), InputAction::NONE);
}

TEST(InputMappingTest, GamepadButtons) {
    EXPECT_EQ(mapGamepadButton(SDL_CONTROLLER_BUTTON_DPAD_UP), InputAction::MOVE_UP);
    EXPECT_EQ(mapGamepadButton(SDL_CONTROLLER_BUTTON_DPAD_DOWN), InputAction::MOVE_DOWN);
    EXPECT_EQ(mapGamepadButton(SDL_CONTROLLER_BUTTON_DPAD_LEFT), InputAction::MOVE_LEFT);
    EXPECT_EQ(mapGamepadButton(SDL_CONTROLLER_BUTTON_DPAD_RIGHT), InputAction::MOVE_RIGHT);
    EXPECT_EQ(mapGamepadButton(SDL_CONTROLLER_BUTTON_A), InputAction::CONFIRM);
    EXPECT_EQ(mapGamepadButton(SDL_CONTROLLER_BUTTON_Y), InputAction::RESET);
    EXPECT_EQ(mapGamepadButton(SDL_CONTROLLER_BUTTON_X), InputAction::PAUSE);
    EXPECT_EQ(mapGamepadButton(SDL_CONTROLLER_BUTTON_START), InputAction::QUIT);
    EXPECT_EQ(mapGamepadButton(SDL_CONTROLLER_BUTTON_B), InputAction::NONE);
}

TEST(InputMappingTest, ActionNames) {
    EXPECT_EQ(std::string(inputActionName(InputAction::PAUSE)), "PAUSE");
    EXPECT_EQ(std::string(inputActionName(InputAction::SPEED_DOWN)), "SPEED_DOWN");
    EXPECT_EQ(std::string(inputActionName(InputAction::INPUT_ACTION_COUNT)), "?");
}
