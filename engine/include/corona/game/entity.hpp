/*!
  \file entity.hpp
  The pieces every entity in a session is made of. An entity is anything that
  has an image, a rectangle in the world, and a layer to be drawn on. What it
  does each tick is up to the entity itself.
*/
#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include <corona/common/rect.hpp>
#include <corona/renderer/image.hpp>

namespace corona
{
/*!
  The renderable part of an entity. The rect is where the image is drawn and
  what bounding box collisions are tested against.
*/
struct Visual
{
  //! The current frame
  Image image;

  //! Position and size in the world
  Rect rect;

  //! Draw order only, higher is drawn later
  int32_t layer = 0;

  //! Opaque pixels of the current frame, empty for entities that only need box tests
  Mask mask;
};

/*!
  Build a Visual for an image with its top-left corner at x, y
*/
inline Visual make_visual(const Image& image, double x, double y, int32_t layer)
{
  Visual visual;
  visual.image = image;
  visual.rect = Rect(x, y, image ? image->w : 0, image ? image->h : 0);
  visual.layer = layer;
  return visual;
}

/*!
  Stable reference to an entity in a Session. The generation changes every
  time a slot is reused so an old handle never points at a newer entity.
*/
struct EntityHandle
{
  uint32_t index = 0;
  uint32_t generation = 0;

  bool operator==(const EntityHandle& other) const
  {
    return index == other.index && generation == other.generation;
  }

  bool operator!=(const EntityHandle& other) const
  {
    return !(*this == other);
  }
};

//! The named collections an entity can belong to
enum class Group : uint8_t
{
  all = 0,
  platforms,
  bases,
  enemies,
  clouds
};

constexpr size_t group_count = 5;

inline const char* group_name(Group group)
{
  switch (group) {
    case Group::all: return "all";
    case Group::platforms: return "platforms";
    case Group::bases: return "bases";
    case Group::enemies: return "enemies";
    case Group::clouds: return "clouds";
  }
  return "unknown";
}

/*!
  Read-only overlap tests against the collections of a session. Nothing that
  answers these may move, remove or otherwise change a member of the group.
*/
class CollisionQuery
{
public:
  virtual ~CollisionQuery() = default;

  /*!
    \param rect - The rectangle to test
    \param group - The collection to test against
    \return true iff rect overlaps any member of group
  */
  virtual bool probe(const Rect& rect, Group group) const = 0;

  /*!
    \return The rectangles of every member of group that rect overlaps
  */
  virtual std::vector<Rect> overlapping(const Rect& rect, Group group) const = 0;
};
} // namespace corona
