/*!
  \file keyboard.hpp
  What the player is doing this tick. Directions are held keys, the jump is
  edge-triggered: pressed and released are only set on the tick they happen.
*/
#pragma once

#include <map>

#include <SDL.h>

namespace corona
{
struct InputState
{
  bool left = false;
  bool right = false;
  bool jump_pressed = false;
  bool jump_released = false;
};

/*!
  Turns SDL keyboard events into InputState snapshots.
  Arrow keys move and space jumps.
*/
class Keyboard
{
public:
  /*!
    Record a key event
    \param e - Any SDL event, non-keyboard events are ignored
    \return Whether the event was used
  */
  bool handle(const SDL_Event& e);

  /*!
    Returns the current held keys and the jump edges seen since the last
    snapshot. The edges are cleared.
  */
  InputState snapshot();

public:
  //! Which scancodes are currently down
  std::map<SDL_Scancode, bool> keys;

  bool jump_pressed = false;
  bool jump_released = false;
};
} // namespace corona
