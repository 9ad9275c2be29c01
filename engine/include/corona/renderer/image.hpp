/*!
  \file image.hpp
  Shared SDL surfaces and the per-pixel masks derived from them. Every image
  that leaves this module is RGBA32 with black as its color key.
*/
#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include <SDL.h>

/*!
Deleters for SDL objects that are allocated via std::shared_ptr
*/
struct SDLDeleter {
  void operator()(SDL_Texture* p) const;
  void operator()(SDL_Surface* p) const;
};

namespace corona
{
using Image = std::shared_ptr<SDL_Surface>;

/*!
  Wrap a surface into an Image. The surface is converted to RGBA32 and black
  is set as the transparent color key. The passed in surface is freed.
  \param surface - A surface owned by the caller, may be null
  \return The converted image or null if the surface was null or could not be converted
*/
Image adopt_surface(SDL_Surface* surface);

/*!
  Create a solid image
  \param w - The width in pixels
  \param h - The height in pixels
  \param color - What to fill the image with
*/
Image make_image(int32_t w, int32_t h, SDL_Color color = {255, 255, 255, 255});

/*!
  Cut a region out of a larger image. The region is not bounds checked,
  anything outside of the source ends up transparent.
*/
Image crop_image(const Image& source, const SDL_Rect& region);

/*!
  Resample an image to round(w * scale) x round(h * scale)
*/
Image scale_image(const Image& source, double scale);

//! Mirror an image along the X-axis
Image flip_horizontal(const Image& source);

//! Read the pixel at x, y as RGBA
SDL_Color pixel_at(const Image& image, int32_t x, int32_t y);

/*!
  A per-pixel opacity mask of an image. Used for precise overlap tests once
  two bounding boxes are known to intersect.
*/
class Mask
{
public:
  Mask() = default;
  Mask(int32_t w_, int32_t h_);

  /*!
    A pixel is opaque when it has alpha and is not the color key
    \param image - The image to build the mask from
    \return The mask, empty if there is no image
  */
  static Mask from_image(const Image& image);

  bool get(int32_t x, int32_t y) const;
  void set(int32_t x, int32_t y, bool opaque);

  //! How many opaque pixels are in the mask
  size_t count() const;

  /*!
    Checks if any opaque pixel of this mask lands on an opaque pixel of another mask
    \param other - The mask to test against
    \param dx - Where the left edge of other is relative to this mask
    \param dy - Where the top edge of other is relative to this mask
    \return Whether the masks overlap
  */
  bool overlaps(const Mask& other, int32_t dx, int32_t dy) const;

public:
  int32_t w = 0;
  int32_t h = 0;
  std::vector<uint8_t> bits;
};
} // namespace corona
