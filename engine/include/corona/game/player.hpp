/*!
  \file player.hpp
  The character the player controls. Owns its physics state (position,
  velocity, acceleration), whether it is jumping, and which animation frame
  is showing.
*/
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <corona/common/rect.hpp>
#include <corona/game/entity.hpp>
#include <corona/game/settings.hpp>
#include <corona/input/keyboard.hpp>
#include <corona/renderer/image.hpp>

namespace corona
{
enum class Facing
{
  left,
  right
};

/*!
  One animation in both directions. The left-facing frames are mirrors of
  the right-facing ones so both always have the same length.
*/
struct FrameSet
{
  std::vector<Image> right;
  std::vector<Image> left;

  //! Build a set from right-facing frames, mirroring them for the left
  static FrameSet mirrored(std::vector<Image> right_frames);

  const std::vector<Image>& facing(Facing direction) const
  {
    return direction == Facing::right ? right : left;
  }

  size_t size() const
  {
    return right.size();
  }
};

//! Every animation the player has
struct PlayerFrames
{
  FrameSet idle;
  FrameSet run;
  FrameSet jump;
  FrameSet hurt;
  FrameSet shoot;
};

/*!
  Advance an animation index
  \param current - The current frame index
  \param frames - The animation being advanced
  \param name - Which animation, used in the error
  \return (current + 1) % frames.size()
  \throws ConfigurationError if the animation has no frames
*/
size_t next_frame(size_t current, const FrameSet& frames, const std::string& name);

class Player
{
public:
  /*!
    Create a player standing at the configured start position
    \param frames_ - Animation frames, shared between sessions
    \param settings - Physics, animation, and layer settings
    \throws ConfigurationError if there are no idle frames to start with
  */
  Player(std::shared_ptr<const PlayerFrames> frames_, const Settings& settings);

  /*!
    One tick of the player: animate with the current velocity, then
    integrate acceleration, velocity, and position.
    \param input - Which directions are held
    \param now_ms - The monotonic frame time in milliseconds
  */
  void update(const InputState& input, int64_t now_ms);

  /*!
    Pick the frame to show from the velocity, the jump state, and how long the
    current frame has been up. The bottom of the rectangle never moves when
    the frame changes.
    \param now_ms - The monotonic frame time in milliseconds
  */
  void animate(int64_t now_ms);

  /*!
    Start a jump if there is terrain under or just ahead of the player.
    The probe looks jump_probe_px to the right of the player's rectangle
    against platforms and bases without changing either.
    \param world - Where the platforms and bases are
    \return Whether the jump started
  */
  bool jump(const CollisionQuery& world);

  /*!
    Shorten a jump in progress. While rising faster than the cut threshold
    the upward velocity is clamped to the threshold, otherwise nothing happens.
  */
  void jump_cut();

  /*!
    Rest on terrain. If the player overlaps a platform or base while not
    rising, and its feet are not below the middle of that terrain, the feet
    are put on top of it, the vertical velocity is zeroed and the jump ends.
    \param world - Where the platforms and bases are
    \return Whether the player is standing on terrain
  */
  bool land(const CollisionQuery& world);

  /*!
    Move the player and bring the rectangle along
    \param position - The new bottom-center of the player
  */
  void place(const Point& position);

  //! Re-derive the rectangle from the position, position is the source of truth
  void sync_rect();

private:
  //! Swap the image keeping the bottom-center of the rectangle in place
  void show(const Image& image);

public:
  Visual visual;

  //! Bottom-center of the player in the world
  Point pos;
  Point vel;

  //! Recomputed from scratch every tick
  Point acc;

  bool is_running;
  bool is_jumping;
  Facing facing;

  //! Animation tracking
  size_t current_frame;
  int64_t last_update_ms;

  std::shared_ptr<const PlayerFrames> frames;
  PlayerSettings tuning;
  double gravity;
};
} // namespace corona
