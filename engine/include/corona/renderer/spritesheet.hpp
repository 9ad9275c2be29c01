/*!
  \file spritesheet.hpp
  Cuts sub-images out of a larger image. A sheet can be a bare image where the
  caller knows the offsets, or a JSON manifest naming the regions of an image.
*/
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <SDL.h>

#include <corona/common/filesystem.hpp>
#include <corona/renderer/image.hpp>

namespace corona
{
/*!
  Decode an image file with SDL_image
  \param path - The image file
  \return The decoded image, never null
  \throws AssetLoadError if the file can not be decoded
*/
Image load_image(const FileInfo& path);

/*!
  Load every image in a directory, ordered by filename, as an animation sequence
  \param dir - The directory of frames
  \param scale - The scale multiplier applied to every frame
  \return The frames in order
  \throws AssetLoadError if the directory is missing or a frame can not be decoded
*/
std::vector<Image> load_frames(const FileInfo& dir, double scale);

//! Mirror every frame of a sequence, used to make left-facing frames from right-facing ones
std::vector<Image> flip_frames(const std::vector<Image>& frames);

class SpriteSheet
{
public:
  explicit SpriteSheet(Image image_);

  /*!
    Load a sheet from a bare image file
    \throws AssetLoadError if the image can not be decoded
  */
  static std::shared_ptr<SpriteSheet> from_file(const FileInfo& path);

  /*!
    Load a sheet from a manifest in the form of
      { "image": "sheet.png", "regions": { "name": { "x": 0, "y": 0, "w": 8, "h": 8 } } }
    The image path is relative to the manifest.
    \throws AssetLoadError if the manifest or the image can not be loaded
  */
  static std::shared_ptr<SpriteSheet> from_json(const FileInfo& path);

  /*!
    Grabs a smaller image from the larger spritesheet
    \param x - Left edge of the region
    \param y - Top edge of the region
    \param w - Width of the region
    \param h - Height of the region
    \param scale - The scale of the returned image
    \return A new image of round(w * scale) x round(h * scale)
  */
  Image get_image(int32_t x, int32_t y, int32_t w, int32_t h, double scale = 0.5) const;

  /*!
    Grabs a named region from the manifest
    \throws AssetLoadError if the region does not exist
  */
  Image get_image(const std::string& name, double scale = 0.5) const;

  bool has_region(const std::string& name) const;

public:
  //! The full sheet
  Image image;

  //! Named regions from the manifest, if there was one
  std::map<std::string, SDL_Rect> regions;
};
} // namespace corona
