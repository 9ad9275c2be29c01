/*!
  \file renderer.hpp
  This file handles the initialization and setup of the rendering window and
  draws a session's visuals onto it in layer order.
*/
#pragma once

#include <map>
#include <memory>
#include <vector>

#include <SDL.h>

#include <corona/game/entity.hpp>
#include <corona/game/settings.hpp>
#include <corona/renderer/image.hpp>

namespace corona
{
/*!
  The Renderer owns the window and keeps one texture per live image. A
  headless renderer accepts every call and draws nothing.
*/
class Renderer
{
public:
  explicit Renderer(bool is_headless_)
    : is_headless(is_headless_)
  {
  }

  Renderer(const Renderer&) = delete;
  Renderer& operator=(const Renderer&) = delete;
  ~Renderer();

public:
  /*!
    Create the window from the screen settings
    \return Whether the window and renderer could be created
  */
  bool init(const ScreenSettings& screen);

  /*!
    Clear the screen and draw the visuals in the order given
    \param visuals - Ordered back to front, see Session::render_list
  */
  void run_frame(const std::vector<const Visual*>& visuals);

  /*!
    A utility method to create an SDL_Texture from an image using the current
    SDL_Renderer. Textures are cached for as long as something else holds the image.
  */
  std::shared_ptr<SDL_Texture> texture_for(const Image& image);

public:
  bool is_headless;
  SDL_Color background = {135, 206, 235, 255};
  uint64_t total_frames_rendered = 0;

private:
  struct CachedTexture
  {
    Image image;
    std::shared_ptr<SDL_Texture> texture;
  };

  //! Drop textures whose image nothing but the cache holds anymore
  void prune();

  SDL_Window* window = nullptr;
  SDL_Renderer* renderer = nullptr;
  std::map<SDL_Surface*, CachedTexture> textures;
};
} // namespace corona
