/*!
  \file spawner.hpp
  Keeps a session populated with slimes and clouds over time
*/
#pragma once

#include <cstdint>

#include <corona/game/session.hpp>
#include <corona/game/settings.hpp>

namespace corona
{
class Spawner
{
public:
  explicit Spawner(const Settings& settings);

  /*!
    Schedule the first spawns relative to a point in time
    \param session - Source of randomness for the slime jitter
    \param now_ms - When the schedule starts
  */
  void reset(Session& session, int64_t now_ms);

  /*!
    Spawn whatever is due. A slime is due every spawn_ms plus or minus up to
    spawn_jitter_ms, a cloud every cloud spawn_ms. A zero interval never spawns.
    The first call schedules without spawning.
    \return How many entities were spawned
  */
  size_t tick(Session& session, int64_t now_ms);

public:
  SlimeSettings slime;
  CloudSettings cloud;
  bool scheduled;
  int64_t next_slime_ms;
  int64_t next_cloud_ms;

private:
  int64_t slime_interval(Session& session) const;
};
} // namespace corona
