#include <algorithm>
#include <cmath>
#include <string>

#include <corona/common/errors.hpp>
#include <corona/game/scenery.hpp>

namespace corona
{
namespace
{
const Image& pick(const std::vector<Image>& images, std::mt19937& rng, const char* what)
{
  if (images.empty()) {
    throw ConfigurationError(std::string("There are no ") + what + " images to pick from");
  }
  std::uniform_int_distribution<size_t> index(0, images.size() - 1);
  const auto& image = images[index(rng)];
  if (!image) {
    throw ConfigurationError(std::string("A ") + what + " image is missing");
  }
  return image;
}
} // namespace

Cloud Cloud::random(const std::vector<Image>& images, const Settings& settings, std::mt19937& rng)
{
  const auto& source = pick(images, rng, "cloud");
  const auto& config = settings.cloud;

  // Hundredths so the scale lands on the same steps every time
  std::uniform_int_distribution<int32_t> hundredths(static_cast<int32_t>(std::lround(config.min_scale * 100)),
                                                    static_cast<int32_t>(std::lround(config.max_scale * 100)));

  Cloud cloud;
  cloud.scale = hundredths(rng) / 100.0;
  auto image = scale_image(source, cloud.scale);

  const auto w = image->w;
  std::uniform_int_distribution<int32_t> xs(settings.screen.width, settings.screen.width + std::max(w, 1) - 1);
  std::uniform_int_distribution<int32_t> ys(0, std::max(settings.screen.height * 2 / 3, 1) - 1);

  cloud.visual = make_visual(image, xs(rng), ys(rng), settings.layers.cloud);
  return cloud;
}

Platform Platform::random(const std::vector<Image>& images, double x, double y, int32_t layer, std::mt19937& rng)
{
  Platform platform;
  platform.visual = make_visual(pick(images, rng, "platform"), x, y, layer);
  return platform;
}

Base::Base(const Image& image, double x, const Settings& settings)
{
  if (!image) {
    throw ConfigurationError("The base image is missing");
  }
  visual = make_visual(image, x, settings.screen.height - settings.terrain.base_height, settings.layers.platform);
}
} // namespace corona
