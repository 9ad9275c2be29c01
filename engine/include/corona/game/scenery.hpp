/*!
  \file scenery.hpp
  Entities that do nothing on their own. Clouds drift only when the world
  scrolls, platforms and bases never change once placed.
*/
#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include <corona/game/entity.hpp>
#include <corona/game/settings.hpp>
#include <corona/renderer/image.hpp>

namespace corona
{
class Cloud
{
public:
  /*!
    A cloud made from one of the images, scaled by a factor drawn from
    [min_scale, max_scale] in hundredths, placed just off the right edge of the
    screen somewhere in the upper two thirds of it
    \throws ConfigurationError if there are no cloud images
  */
  static Cloud random(const std::vector<Image>& images, const Settings& settings, std::mt19937& rng);

  //! \return false once the cloud is entirely left of the screen
  bool update() const
  {
    return visual.rect.right() >= 0;
  }

public:
  Visual visual;
  double scale = 1.0;
};

class Platform
{
public:
  /*!
    A platform using one of the images with its top-left corner at x, y
    \throws ConfigurationError if there are no platform images
  */
  static Platform random(const std::vector<Image>& images, double x, double y, int32_t layer, std::mt19937& rng);

public:
  Visual visual;
};

//! A tile of the ground along the bottom of the screen
class Base
{
public:
  /*!
    \param image - The ground tile
    \param x - The left edge of the tile
    \param settings - Where the ground starts and which layer it is on
    \throws ConfigurationError if the image is missing
  */
  Base(const Image& image, double x, const Settings& settings);

public:
  Visual visual;
};
} // namespace corona
