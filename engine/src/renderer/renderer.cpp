#include <cmath>

#include <corona/common/logging.hpp>
#include <corona/renderer/renderer.hpp>

namespace
{
auto logger = corona::_get_logger(__FILE__);
}

namespace corona
{
Renderer::~Renderer()
{
  textures.clear();
  if (renderer) {
    SDL_DestroyRenderer(renderer);
  }
  if (window) {
    SDL_DestroyWindow(window);
  }
}

bool Renderer::init(const ScreenSettings& screen)
{
  if (is_headless) {
    logger->info("Running headless, nothing will be drawn");
    return true;
  }

  window = SDL_CreateWindow(screen.title.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                            screen.width, screen.height, SDL_WINDOW_SHOWN);
  if (!window) {
    logger->error("Window could not be created: {}", SDL_GetError());
    return false;
  }

  renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
  if (!renderer) {
    logger->error("Renderer could not be created: {}", SDL_GetError());
    return false;
  }

  logger->info("Opened a {}x{} window", screen.width, screen.height);
  return true;
}

std::shared_ptr<SDL_Texture> Renderer::texture_for(const Image& image)
{
  if (is_headless || !renderer || !image) {
    return nullptr;
  }

  const auto found = textures.find(image.get());
  if (found != textures.end()) {
    return found->second.texture;
  }

  std::shared_ptr<SDL_Texture> texture(SDL_CreateTextureFromSurface(renderer, image.get()), SDLDeleter());
  if (!texture) {
    logger->error("Failed to create a texture: {}", SDL_GetError());
    return nullptr;
  }

  textures[image.get()] = {image, texture};
  return texture;
}

void Renderer::run_frame(const std::vector<const Visual*>& visuals)
{
  if (is_headless || !renderer) {
    ++total_frames_rendered;
    return;
  }

  SDL_SetRenderDrawColor(renderer, background.r, background.g, background.b, background.a);
  SDL_RenderClear(renderer);

  for (const auto visual : visuals) {
    auto texture = this->texture_for(visual->image);
    if (!texture) {
      continue;
    }

    SDL_Rect dst;
    dst.x = static_cast<int>(std::lround(visual->rect.x));
    dst.y = static_cast<int>(std::lround(visual->rect.y));
    dst.w = static_cast<int>(std::lround(visual->rect.w));
    dst.h = static_cast<int>(std::lround(visual->rect.h));
    SDL_RenderCopy(renderer, texture.get(), nullptr, &dst);
  }

  SDL_RenderPresent(renderer);
  this->prune();
  ++total_frames_rendered;
}

void Renderer::prune()
{
  for (auto it = textures.begin(); it != textures.end();) {
    if (it->second.image.use_count() == 1) {
      it = textures.erase(it);
    } else {
      ++it;
    }
  }
}
} // namespace corona
