/*!
  \file session.hpp
  One play session: every live entity, the collections they belong to, and
  the order they are updated in each tick. Entities are referred to by
  handles, never by pointer, so removing one can not leave anything dangling.
*/
#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>

#include <corona/game/artwork.hpp>
#include <corona/game/entity.hpp>
#include <corona/game/player.hpp>
#include <corona/game/scenery.hpp>
#include <corona/game/settings.hpp>
#include <corona/game/slime.hpp>
#include <corona/input/keyboard.hpp>

namespace corona
{
using Entity = std::variant<Player, Slime, Cloud, Platform, Base>;

//! The renderable part of any entity
Visual& visual_of(Entity& entity);
const Visual& visual_of(const Entity& entity);

class Session : public CollisionQuery
{
public:
  /*!
    \param artwork_ - The images every entity is built from
    \param settings_ - Copied, a session never sees later changes
    \param seed - Seed for every random choice the session makes
  */
  Session(std::shared_ptr<const Artwork> artwork_, const Settings& settings_, uint32_t seed = std::random_device{}());

  /*!
    Populate the world: the player, a row of bases along the bottom of the
    level, the configured platforms and the first clouds
    \throws ConfigurationError if the artwork can not make one of them
  */
  void start();

  /*!
    Add an entity to the session
    \param entity - The entity to take ownership of
    \param groups - The collections it belongs to besides Group::all
    \return The handle to refer to it by
  */
  EntityHandle spawn(Entity entity, std::initializer_list<Group> groups = {});

  EntityHandle spawn_player();
  EntityHandle spawn_slime();
  EntityHandle spawn_cloud();
  EntityHandle spawn_platform(double x, double y);
  EntityHandle spawn_base(double x);

  /*!
    Remove an entity from every collection it belongs to and free its slot
    \return false if the handle was already dead
  */
  bool kill(EntityHandle handle);

  bool alive(EntityHandle handle) const;

  //! \return The entity or null if the handle is dead
  Entity* get(EntityHandle handle);
  const Entity* get(EntityHandle handle) const;

  //! \return The entity if it is alive and a T, otherwise null
  template <class T>
  T* get_as(EntityHandle handle)
  {
    auto entity = this->get(handle);
    return entity ? std::get_if<T>(entity) : nullptr;
  }

  template <class T>
  const T* get_as(EntityHandle handle) const
  {
    auto entity = this->get(handle);
    return entity ? std::get_if<T>(entity) : nullptr;
  }

  //! \return The player or null before start() or after it was killed
  Player* player();
  const Player* player() const;

  //! Members of a collection in the order they were spawned
  const std::vector<EntityHandle>& members(Group group) const;

  //! Number of live entities
  size_t size() const;

  bool probe(const Rect& rect, Group group) const override;
  std::vector<Rect> overlapping(const Rect& rect, Group group) const override;

  //! \return The members of group whose rectangles overlap rect
  std::vector<EntityHandle> hits(const Rect& rect, Group group) const;

  /*!
    Members of a group whose opaque pixels touch the opaque pixels of an
    entity. Entities without a mask fall back to their rectangle.
    \param handle - The entity to test, it is never part of the result
    \param group - The collection to test against
  */
  std::vector<EntityHandle> collide_precise(EntityHandle handle, Group group) const;

  /*!
    Run one tick: the player moves, then jumps or cuts its jump, then lands.
    Slimes and clouds move and leave once off screen, then the world scrolls.
    \param input - This tick's input
    \param now_ms - The monotonic frame time in milliseconds
  */
  void update(const InputState& input, int64_t now_ms);

  /*!
    Shift the world left around the player. Clouds move by dx * parallax.
    \param dx - How far to shift, positive moves everything left
  */
  void scroll(double dx);

  //! Every live visual ordered by layer, spawn order within a layer
  std::vector<const Visual*> render_list() const;

public:
  Settings settings;
  std::shared_ptr<const Artwork> artwork;
  EntityHandle player_handle;

  //! Called with the name of a sound cue, "jump" when a jump starts
  std::function<void(const std::string&)> on_sound;

  std::mt19937 rng;

  //! How far the world has scrolled in total
  double scrolled;

private:
  struct Slot
  {
    //! Starts at 1 so a default handle is never alive
    uint32_t generation = 1;
    std::optional<Entity> entity;
    std::vector<Group> groups;
  };

  std::vector<Slot> slots;
  std::vector<uint32_t> free_slots;
  std::array<std::vector<EntityHandle>, group_count> collections;
};
} // namespace corona
