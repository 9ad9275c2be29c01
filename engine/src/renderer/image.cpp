#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include <corona/common/errors.hpp>
#include <corona/common/logging.hpp>
#include <corona/renderer/image.hpp>

namespace
{
auto logger = corona::_get_logger(__FILE__);

// Surfaces in RGBA32 are always 4 bytes per pixel
Uint32* row(SDL_Surface* surface, int32_t y)
{
  auto pixels = static_cast<uint8_t*>(surface->pixels);
  return reinterpret_cast<Uint32*>(pixels + y * surface->pitch);
}

class SurfaceLock
{
public:
  explicit SurfaceLock(SDL_Surface* surface_)
    : surface(surface_)
  {
    if (SDL_MUSTLOCK(surface)) {
      SDL_LockSurface(surface);
    }
  }

  ~SurfaceLock()
  {
    if (SDL_MUSTLOCK(surface)) {
      SDL_UnlockSurface(surface);
    }
  }

  SurfaceLock(const SurfaceLock&) = delete;
  SurfaceLock& operator=(const SurfaceLock&) = delete;

private:
  SDL_Surface* surface;
};

SDL_Surface* blank_surface(int32_t w, int32_t h)
{
  auto surface = SDL_CreateRGBSurfaceWithFormat(0, w, h, 32, SDL_PIXELFORMAT_RGBA32);
  if (!surface) {
    throw corona::AssetLoadError(fmt::format("Could not allocate a {}x{} surface: {}", w, h, SDL_GetError()));
  }
  SDL_FillRect(surface, nullptr, SDL_MapRGBA(surface->format, 0, 0, 0, 0));
  return surface;
}

corona::Image keyed(SDL_Surface* surface)
{
  SDL_SetColorKey(surface, SDL_TRUE, SDL_MapRGB(surface->format, 0, 0, 0));
  return corona::Image(surface, SDLDeleter());
}
}

void SDLDeleter::operator()(SDL_Texture* p) const
{
  if (p) {
    SDL_DestroyTexture(p);
  }
}

void SDLDeleter::operator()(SDL_Surface* p) const
{
  if (p) {
    SDL_FreeSurface(p);
  }
}

namespace corona
{
Image adopt_surface(SDL_Surface* surface)
{
  if (!surface) {
    return nullptr;
  }

  auto converted = SDL_ConvertSurfaceFormat(surface, SDL_PIXELFORMAT_RGBA32, 0);
  SDL_FreeSurface(surface);
  if (!converted) {
    logger->error("Failed to convert surface to RGBA32: {}", SDL_GetError());
    return nullptr;
  }

  return keyed(converted);
}

Image make_image(int32_t w, int32_t h, SDL_Color color)
{
  auto surface = blank_surface(w, h);
  SDL_FillRect(surface, nullptr, SDL_MapRGBA(surface->format, color.r, color.g, color.b, color.a));
  return keyed(surface);
}

Image crop_image(const Image& source, const SDL_Rect& region)
{
  auto surface = blank_surface(region.w, region.h);
  SDL_Rect src = region;
  SDL_SetSurfaceBlendMode(source.get(), SDL_BLENDMODE_NONE);
  SDL_BlitSurface(source.get(), &src, surface, nullptr);
  return keyed(surface);
}

Image scale_image(const Image& source, double scale)
{
  if (scale <= 0) {
    throw ConfigurationError(fmt::format("Image scale must be positive, got {}", scale));
  }

  const auto w = static_cast<int32_t>(std::lround(source->w * scale));
  const auto h = static_cast<int32_t>(std::lround(source->h * scale));
  auto surface = blank_surface(w, h);

  if (w > 0 && h > 0) {
    SDL_SetSurfaceBlendMode(source.get(), SDL_BLENDMODE_NONE);
    SDL_BlitScaled(source.get(), nullptr, surface, nullptr);
  }

  return keyed(surface);
}

Image flip_horizontal(const Image& source)
{
  auto surface = blank_surface(source->w, source->h);
  {
    SurfaceLock src_lock(source.get());
    SurfaceLock dst_lock(surface);
    for (int32_t y = 0; y < source->h; ++y) {
      const Uint32* src_row = row(source.get(), y);
      Uint32* dst_row = row(surface, y);
      for (int32_t x = 0; x < source->w; ++x) {
        dst_row[source->w - 1 - x] = src_row[x];
      }
    }
  }
  return keyed(surface);
}

SDL_Color pixel_at(const Image& image, int32_t x, int32_t y)
{
  SDL_Color color = {0, 0, 0, 0};
  SurfaceLock lock(image.get());
  const Uint32 px = row(image.get(), y)[x];
  SDL_GetRGBA(px, image->format, &color.r, &color.g, &color.b, &color.a);
  return color;
}

Mask::Mask(int32_t w_, int32_t h_)
  : w(w_)
  , h(h_)
  , bits(static_cast<size_t>(w_) * static_cast<size_t>(h_), 0)
{
}

Mask Mask::from_image(const Image& image)
{
  if (!image) {
    return Mask();
  }

  Mask mask(image->w, image->h);

  Uint32 key = 0;
  const bool has_key = SDL_GetColorKey(image.get(), &key) == 0;

  SurfaceLock lock(image.get());
  for (int32_t y = 0; y < image->h; ++y) {
    const Uint32* pixels = row(image.get(), y);
    for (int32_t x = 0; x < image->w; ++x) {
      if (has_key && pixels[x] == key) {
        continue;
      }
      Uint8 r, g, b, a;
      SDL_GetRGBA(pixels[x], image->format, &r, &g, &b, &a);
      // Cleared pixels are black with no alpha, they never match the key exactly
      mask.set(x, y, a > 0 && !(has_key && r == 0 && g == 0 && b == 0));
    }
  }

  return mask;
}

bool Mask::get(int32_t x, int32_t y) const
{
  if (x < 0 || y < 0 || x >= w || y >= h) {
    return false;
  }
  return bits[static_cast<size_t>(y) * w + x] != 0;
}

void Mask::set(int32_t x, int32_t y, bool opaque)
{
  if (x < 0 || y < 0 || x >= w || y >= h) {
    return;
  }
  bits[static_cast<size_t>(y) * w + x] = opaque ? 1 : 0;
}

size_t Mask::count() const
{
  return static_cast<size_t>(std::count(bits.begin(), bits.end(), 1));
}

bool Mask::overlaps(const Mask& other, int32_t dx, int32_t dy) const
{
  // Overlap of the two masks in this mask's coordinates
  const auto x0 = std::max(0, dx);
  const auto y0 = std::max(0, dy);
  const auto x1 = std::min(w, dx + other.w);
  const auto y1 = std::min(h, dy + other.h);

  for (int32_t y = y0; y < y1; ++y) {
    for (int32_t x = x0; x < x1; ++x) {
      if (this->get(x, y) && other.get(x - dx, y - dy)) {
        return true;
      }
    }
  }

  return false;
}

} // namespace corona
