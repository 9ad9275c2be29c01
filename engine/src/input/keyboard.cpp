#include <corona/input/keyboard.hpp>

namespace corona {

bool Keyboard::handle(const SDL_Event& e)
{
  if (e.type != SDL_KEYDOWN && e.type != SDL_KEYUP) {
    return false;
  }

  const auto key = e.key.keysym.scancode;

  // The key states for dispatch
  const auto is_down = e.type == SDL_KEYDOWN;
  const auto key_pressed = !keys[key] && is_down;
  const auto key_released = keys[key] && !is_down;

  keys[key] = is_down;

  if (key == SDL_SCANCODE_SPACE) {
    if (key_pressed) {
      jump_pressed = true;
    } else if (key_released) {
      jump_released = true;
    }
  }

  return true;
}

InputState Keyboard::snapshot()
{
  InputState state;
  state.left = keys[SDL_SCANCODE_LEFT];
  state.right = keys[SDL_SCANCODE_RIGHT];
  state.jump_pressed = jump_pressed;
  state.jump_released = jump_released;

  jump_pressed = false;
  jump_released = false;
  return state;
}

} // namespace corona
