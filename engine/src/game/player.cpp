#include <cmath>

#include <fmt/format.h>

#include <corona/common/errors.hpp>
#include <corona/common/logging.hpp>
#include <corona/game/player.hpp>
#include <corona/renderer/spritesheet.hpp>

namespace
{
auto logger = corona::_get_logger(__FILE__);
};

namespace corona
{
FrameSet FrameSet::mirrored(std::vector<Image> right_frames)
{
  FrameSet set;
  set.left = flip_frames(right_frames);
  set.right = std::move(right_frames);
  return set;
}

size_t next_frame(size_t current, const FrameSet& frames, const std::string& name)
{
  if (frames.size() == 0) {
    throw ConfigurationError(fmt::format("The {} animation has no frames", name));
  }
  return (current + 1) % frames.size();
}

Player::Player(std::shared_ptr<const PlayerFrames> frames_, const Settings& settings)
  : is_running(false),
    is_jumping(false),
    facing(Facing::right),
    current_frame(0),
    last_update_ms(0),
    frames(std::move(frames_)),
    tuning(settings.player),
    gravity(settings.physics.gravity)
{
  if (!frames || frames->idle.size() == 0) {
    throw ConfigurationError("The player needs at least one idle frame");
  }

  visual.layer = settings.layers.player;
  pos = {tuning.start_x, settings.screen.height - tuning.start_height};
  vel = {0, 0};
  acc = {0, 0};
  show(frames->idle.right[0]);
  sync_rect();
}

void Player::update(const InputState& input, int64_t now_ms)
{
  this->animate(now_ms);

  acc = {0, gravity};

  // Left wins when both directions are held
  if (input.left) {
    acc.x = -tuning.acceleration;
  } else if (input.right) {
    acc.x = tuning.acceleration;
  }

  acc.x += vel.x * -tuning.friction;

  vel += acc;
  if (std::fabs(vel.x) < tuning.velocity_deadzone) {
    vel.x = 0;
  }

  pos += vel + acc * 0.5;
  sync_rect();

  if (visual.rect.left() < 0) {
    pos.x = tuning.wall_offset + visual.rect.w / 2.0;
    sync_rect();
  }
}

void Player::animate(int64_t now_ms)
{
  const auto elapsed = now_ms - last_update_ms;
  is_running = vel.x != 0;

  if (is_running && elapsed > tuning.run_frame_ms) {
    last_update_ms = now_ms;
    current_frame = next_frame(current_frame, frames->run, "run");
    facing = vel.x > 0 ? Facing::right : Facing::left;
    show(frames->run.facing(facing)[current_frame]);
  }

  if (!is_jumping && !is_running && elapsed > tuning.idle_frame_ms) {
    last_update_ms = now_ms;
    current_frame = next_frame(current_frame, frames->idle, "idle");
    facing = pos.x > 0 ? Facing::right : Facing::left;
    show(frames->idle.facing(facing)[current_frame]);
  }

  if (is_jumping && !is_running && elapsed > tuning.jump_frame_ms) {
    last_update_ms = now_ms;
    current_frame = next_frame(current_frame, frames->jump, "jump");
    show(frames->jump.facing(facing)[current_frame]);
  }
}

bool Player::jump(const CollisionQuery& world)
{
  Rect ahead = visual.rect;
  ahead.move(tuning.jump_probe_px, 0);

  const bool on_platform = world.probe(ahead, Group::platforms);
  const bool on_base = world.probe(ahead, Group::bases);

  if (!(on_platform || on_base) || is_jumping) {
    return false;
  }

  vel.y = -tuning.jump_velocity;
  is_jumping = true;
  logger->debug("Jumped from {}", on_platform ? "a platform" : "the base");
  return true;
}

void Player::jump_cut()
{
  if (is_jumping && vel.y < -tuning.jump_cut_threshold) {
    vel.y = -tuning.jump_cut_threshold;
  }
}

bool Player::land(const CollisionQuery& world)
{
  if (vel.y < 0) {
    return false;
  }

  auto hits = world.overlapping(visual.rect, Group::platforms);
  auto base_hits = world.overlapping(visual.rect, Group::bases);
  hits.insert(hits.end(), base_hits.begin(), base_hits.end());

  bool landed = false;
  double top = 0;
  for (const auto& hit : hits) {
    if (pos.y > hit.centery()) {
      continue;
    }
    if (!landed || hit.top() < top) {
      top = hit.top();
    }
    landed = true;
  }

  if (!landed) {
    return false;
  }

  pos.y = top;
  vel.y = 0;
  is_jumping = false;
  sync_rect();
  return true;
}

void Player::place(const Point& position)
{
  pos = position;
  sync_rect();
}

void Player::sync_rect()
{
  visual.rect.set_midbottom(pos);
}

void Player::show(const Image& image)
{
  if (!image) {
    throw ConfigurationError("Tried to show a missing player frame");
  }

  const auto anchor = visual.rect.midbottom();
  visual.image = image;
  visual.rect.w = image->w;
  visual.rect.h = image->h;
  visual.rect.set_midbottom(anchor);
  visual.mask = Mask::from_image(image);
}
} // namespace corona
