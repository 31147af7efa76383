#include "snake_input.h"
#ifdef __APPLE__
#include <SDL.h>
#else
#include <SDL2/SDL.h>
#endif

InputAction mapKeyboardKey(int keyCode) {
    switch (keyCode) {
        case SDLK_UP:
        case SDLK_w:
            return InputAction::MOVE_UP;
        case SDLK_DOWN:
        case SDLK_s:
            return InputAction::MOVE_DOWN;
        case SDLK_LEFT:
        case SDLK_a:
            return InputAction::MOVE_LEFT;
        case SDLK_RIGHT:
        case SDLK_d:
            return InputAction::MOVE_RIGHT;

        case SDLK_RETURN:
        case SDLK_KP_ENTER:
            return InputAction::CONFIRM;
        case SDLK_r:
            return InputAction::RESET;
        case SDLK_SPACE:
            return InputAction::PAUSE;

        case SDLK_EQUALS:
        case SDLK_PLUS:
        case SDLK_KP_PLUS:
            return InputAction::SPEED_UP;
        case SDLK_MINUS:
        case SDLK_KP_MINUS:
            return InputAction::SPEED_DOWN;

        case SDLK_ESCAPE:
            return InputAction::QUIT;
    }
    return InputAction::NONE;
}

InputAction mapGamepadButton(int button) {
    switch (button) {
        case SDL_CONTROLLER_BUTTON_DPAD_UP:
            return InputAction::MOVE_UP;
        case SDL_CONTROLLER_BUTTON_DPAD_DOWN:
            return InputAction::MOVE_DOWN;
        case SDL_CONTROLLER_BUTTON_DPAD_LEFT:
            return InputAction::MOVE_LEFT;
        case SDL_CONTROLLER_BUTTON_DPAD_RIGHT:
            return InputAction::MOVE_RIGHT;
        case SDL_CONTROLLER_BUTTON_A:
            return InputAction::CONFIRM;
        case SDL_CONTROLLER_BUTTON_Y:
            return InputAction::RESET;
        case SDL_CONTROLLER_BUTTON_X:
            return InputAction::PAUSE;
        case SDL_CONTROLLER_BUTTON_RIGHTSHOULDER:
            return InputAction::SPEED_UP;
        case SDL_CONTROLLER_BUTTON_LEFTSHOULDER:
            return InputAction::SPEED_DOWN;
        case SDL_CONTROLLER_BUTTON_START:
            return InputAction::QUIT;
    }
    return InputAction::NONE;
}

const char* inputActionName(InputAction action) {
    switch (action) {
        case InputAction::NONE:       return "NONE";
        case InputAction::MOVE_UP:    return "MOVE_UP";
        case InputAction::MOVE_DOWN:  return "MOVE_DOWN";
        case InputAction::MOVE_LEFT:  return "MOVE_LEFT";
        case InputAction::MOVE_RIGHT: return "MOVE_RIGHT";
        case InputAction::CONFIRM:    return "CONFIRM";
        case InputAction::RESET:      return "RESET";
        case InputAction::PAUSE:      return "PAUSE";
        case InputAction::SPEED_UP:   return "SPEED_UP";
        case InputAction::SPEED_DOWN: return "SPEED_DOWN";
        case InputAction::QUIT:       return "QUIT";
        default:                      return "?";
    }
}
