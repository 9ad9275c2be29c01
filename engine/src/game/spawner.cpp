#include <random>

#include <corona/game/spawner.hpp>

namespace corona
{
Spawner::Spawner(const Settings& settings)
  : slime(settings.slime),
    cloud(settings.cloud),
    scheduled(false),
    next_slime_ms(0),
    next_cloud_ms(0)
{
}

void Spawner::reset(Session& session, int64_t now_ms)
{
  next_slime_ms = now_ms + this->slime_interval(session);
  next_cloud_ms = now_ms + cloud.spawn_ms;
  scheduled = true;
}

size_t Spawner::tick(Session& session, int64_t now_ms)
{
  if (!scheduled) {
    this->reset(session, now_ms);
    return 0;
  }

  size_t spawned = 0;
  if (slime.spawn_ms > 0 && now_ms >= next_slime_ms) {
    session.spawn_slime();
    next_slime_ms = now_ms + this->slime_interval(session);
    ++spawned;
  }

  if (cloud.spawn_ms > 0 && now_ms >= next_cloud_ms) {
    session.spawn_cloud();
    next_cloud_ms = now_ms + cloud.spawn_ms;
    ++spawned;
  }

  return spawned;
}

int64_t Spawner::slime_interval(Session& session) const
{
  if (slime.spawn_jitter_ms <= 0) {
    return slime.spawn_ms;
  }
  std::uniform_int_distribution<int64_t> jitter(-slime.spawn_jitter_ms, slime.spawn_jitter_ms);
  return slime.spawn_ms + jitter(session.rng);
}
} // namespace corona
