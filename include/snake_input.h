#pragma once

// Actions the driver understands, decoupled from SDL key codes
enum class InputAction {
    NONE = 0,
    MOVE_UP,
    MOVE_DOWN,
    MOVE_LEFT,
    MOVE_RIGHT,
    CONFIRM,    // restart after game over
    RESET,      // restart any time
    PAUSE,
    SPEED_UP,
    SPEED_DOWN,
    QUIT,

    INPUT_ACTION_COUNT
};

// SDL_Keycode -> action
InputAction mapKeyboardKey(int keyCode);

// SDL_GameControllerButton -> action
InputAction mapGamepadButton(int button);

const char* inputActionName(InputAction action);
