#include <fmt/format.h>

#include <corona/common/errors.hpp>
#include <corona/game/slime.hpp>

namespace corona
{
Slime::Slime(std::shared_ptr<const SlimeFrames> frames_, const Settings& settings, int32_t speed_)
  : speed(speed_),
    current_frame(0),
    last_update_ms(0),
    frame_ms(settings.slime.frame_ms),
    frames(std::move(frames_))
{
  if (!frames || frames->walk.empty() || !frames->walk[0]) {
    throw ConfigurationError("A slime needs at least one walk frame");
  }

  visual = make_visual(frames->walk[0], 0, 0, settings.layers.enemy);
  visual.rect.set_left(settings.screen.width);
  visual.rect.set_bottom(settings.screen.height - settings.terrain.base_height + settings.slime.ground_offset);
  visual.mask = Mask::from_image(visual.image);
}

Slime Slime::spawn(std::shared_ptr<const SlimeFrames> frames_, const Settings& settings, std::mt19937& rng)
{
  std::uniform_int_distribution<int32_t> speeds(settings.slime.min_speed, settings.slime.max_speed);
  return Slime(std::move(frames_), settings, speeds(rng));
}

bool Slime::update(int64_t now_ms)
{
  this->animate(now_ms);
  visual.rect.move(-speed, 0);
  return !off_screen();
}

void Slime::animate(int64_t now_ms)
{
  if (now_ms - last_update_ms <= frame_ms) {
    return;
  }

  last_update_ms = now_ms;
  current_frame = (current_frame + 1) % frames->walk.size();

  const auto& image = frames->walk[current_frame];
  if (!image) {
    throw ConfigurationError(fmt::format("Slime walk frame {} is missing", current_frame));
  }

  // The walk frames differ in size, keep the feet where they were
  const auto anchor = visual.rect.midbottom();
  visual.image = image;
  visual.rect.w = image->w;
  visual.rect.h = image->h;
  visual.rect.set_midbottom(anchor);
  visual.mask = Mask::from_image(image);
}
} // namespace corona
