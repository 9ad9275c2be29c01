#include <string>
#include <memory>
#include <map>

#include <fmt/format.h>
#include <picojson.h>
#include <SDL_image.h>

#include <corona/common/errors.hpp>
#include <corona/common/logging.hpp>
#include <corona/renderer/spritesheet.hpp>

namespace
{
auto logger = corona::_get_logger(__FILE__);

int32_t p_int(const picojson::value& v, const std::string& name)
{
  if (!v.is<picojson::object>()) {
    throw corona::AssetLoadError(fmt::format("Expected an object holding {}", name));
  }
  const auto& field = v.get(name);
  if (!field.is<double>()) {
    throw corona::AssetLoadError(fmt::format("Region field {} is missing or not a number", name));
  }
  return static_cast<int32_t>(field.get<double>());
}

std::string p_string(const picojson::value& v, const std::string& name)
{
  if (!v.is<picojson::object>()) {
    throw corona::AssetLoadError(fmt::format("Expected an object holding {}", name));
  }
  const auto& field = v.get(name);
  if (!field.is<std::string>()) {
    throw corona::AssetLoadError(fmt::format("Field {} is missing or not a string", name));
  }
  return field.get<std::string>();
}
}

namespace corona
{
Image load_image(const FileInfo& path)
{
  const auto cpath = path.file_path.string();
  if (!path.exists()) {
    logger->error("Image {} does not exist", path.file_relative.string());
    throw AssetLoadError(fmt::format("{} does not exist", path.file_relative.string()));
  }

  auto image = adopt_surface(IMG_Load(cpath.c_str()));
  if (!image) {
    logger->error("Image failed to load from {}: {}", path.file_relative.string(), IMG_GetError());
    throw AssetLoadError(fmt::format("{} could not be decoded: {}", path.file_relative.string(), IMG_GetError()));
  }

  return image;
}

std::vector<Image> load_frames(const FileInfo& dir, double scale)
{
  const auto files = dir.list();
  if (!files) {
    throw AssetLoadError(fmt::format("{} is not a frame directory", dir.file_relative.string()));
  }

  std::vector<Image> frames;
  for (const auto& file : *files) {
    frames.push_back(scale_image(load_image(file), scale));
  }

  logger->debug("Loaded {} frames from {}", frames.size(), dir.file_relative.string());
  return frames;
}

std::vector<Image> flip_frames(const std::vector<Image>& frames)
{
  std::vector<Image> flipped;
  flipped.reserve(frames.size());
  for (const auto& frame : frames) {
    flipped.push_back(flip_horizontal(frame));
  }
  return flipped;
}

SpriteSheet::SpriteSheet(Image image_)
  : image(std::move(image_))
{
}

std::shared_ptr<SpriteSheet> SpriteSheet::from_file(const FileInfo& path)
{
  logger->info("Loading a new spritesheet from {}", path.file_relative.string());
  return std::make_shared<SpriteSheet>(load_image(path));
}

std::shared_ptr<SpriteSheet> SpriteSheet::from_json(const FileInfo& path)
{
  logger->info("Loading a new spritesheet manifest from {}", path.file_relative.string());
  const auto text = path.read();
  if (!text) {
    throw AssetLoadError(fmt::format("{} could not be read", path.file_relative.string()));
  }

  picojson::value doc;
  const auto err = picojson::parse(doc, *text);
  if (!err.empty()) {
    logger->error("Failed to parse {} with reason {}", path.file_relative.string(), err);
    throw AssetLoadError(fmt::format("{} is not valid JSON: {}", path.file_relative.string(), err));
  }

  const auto image_path = path.from_current_dir(p_string(doc, "image"));
  auto sheet = std::make_shared<SpriteSheet>(load_image(image_path));

  const auto& regions = doc.get("regions");
  if (!regions.is<picojson::object>()) {
    throw AssetLoadError(fmt::format("{} has no regions", path.file_relative.string()));
  }

  for (const auto& region : regions.get<picojson::object>()) {
    SDL_Rect rect;
    rect.x = p_int(region.second, "x");
    rect.y = p_int(region.second, "y");
    rect.w = p_int(region.second, "w");
    rect.h = p_int(region.second, "h");
    sheet->regions[region.first] = rect;
    logger->debug("Adding region {}", region.first);
  }

  return sheet;
}

Image SpriteSheet::get_image(int32_t x, int32_t y, int32_t w, int32_t h, double scale) const
{
  const SDL_Rect region = {x, y, w, h};
  return scale_image(crop_image(image, region), scale);
}

Image SpriteSheet::get_image(const std::string& name, double scale) const
{
  const auto found = regions.find(name);
  if (found == regions.end()) {
    throw AssetLoadError(fmt::format("Spritesheet has no region named {}", name));
  }

  const auto& r = found->second;
  return this->get_image(r.x, r.y, r.w, r.h, scale);
}

bool SpriteSheet::has_region(const std::string& name) const
{
  return regions.find(name) != regions.end();
}

} // namespace corona
