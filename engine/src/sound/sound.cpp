#include <corona/common/logging.hpp>
#include <corona/sound/sound.hpp>

namespace {
auto logger = corona::_get_logger(__FILE__);
constexpr int32_t channel_count = 64;
}

namespace corona {

Sound::~Sound()
{
  cues.clear();
  if (is_open) {
    Mix_CloseAudio();
  }
}

std::shared_ptr<Sound> Sound::open()
{
  if (Mix_OpenAudio(44100, MIX_DEFAULT_FORMAT, 2, 2048) < 0) {
    logger->error("Failed to open the audio device: {}", Mix_GetError());
    return nullptr;
  }

  Mix_AllocateChannels(channel_count);
  std::shared_ptr<Sound> sound(new Sound());
  sound->is_open = true;
  return sound;
}

bool Sound::load(const std::string& cue, const FileInfo& path)
{
  const auto file_path_str = path.file_path.string();
  std::unique_ptr<Mix_Chunk, MixDeleter> chunk(Mix_LoadWAV(file_path_str.c_str()));
  if (!chunk) {
    logger->error("Failed to load sound {} for {}: {}", path.file_relative.string(), cue, Mix_GetError());
    return false;
  }

  cues[cue] = std::move(chunk);
  logger->debug("Loaded sound {} as {}", path.file_relative.string(), cue);
  return true;
}

void Sound::play(const std::string& cue)
{
  const auto found = cues.find(cue);
  if (found == cues.end()) {
    return;
  }

  Mix_Volume(current_channel, volume);
  Mix_PlayChannel(current_channel, found->second.get(), 0);

  current_channel = (current_channel + 1) % channel_count;
}

} // namespace corona
