/*!
  \file sound.hpp
  Fire and forget sound cues. A cue is a name bound to a WAV file.
*/
#pragma once

#include <map>
#include <memory>
#include <string>

#include <SDL_mixer.h>

#include <corona/common/filesystem.hpp>

namespace corona
{
struct MixDeleter
{
  void operator()(Mix_Chunk* p) const
  {
    Mix_FreeChunk(p);
  }
};

class Sound
{
public:
  Sound() = default;
  ~Sound();
  Sound(const Sound&) = delete;
  Sound& operator=(const Sound&) = delete;

  /*!
    Open the audio device
    \return The sound engine or null if there is no audio device
  */
  static std::shared_ptr<Sound> open();

  /*!
    Bind a cue to a WAV file
    \return Whether the file could be loaded, a cue that failed to load is silent
  */
  bool load(const std::string& cue, const FileInfo& path);

  //! Play a cue on the next channel, unknown cues are ignored
  void play(const std::string& cue);

public:
  std::map<std::string, std::unique_ptr<Mix_Chunk, MixDeleter>> cues;
  int32_t volume = 10;

private:
  int32_t current_channel = 0;
  bool is_open = false;
};
} // namespace corona
