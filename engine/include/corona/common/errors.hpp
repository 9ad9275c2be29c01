/*!
  \file errors.hpp
  Exceptions that are surfaced to whoever drives a session
*/
#pragma once

#include <stdexcept>
#include <string>

namespace corona
{
/*!
  An image, spritesheet manifest, or frame directory could not be loaded.
  Nothing can be rendered without its frames, so the session can not start.
*/
class AssetLoadError : public std::runtime_error
{
public:
  explicit AssetLoadError(const std::string& what)
    : std::runtime_error(what)
  {
  }
};

//! A setting or animation table that can not be used as given
class ConfigurationError : public std::runtime_error
{
public:
  explicit ConfigurationError(const std::string& what)
    : std::runtime_error(what)
  {
  }
};
} // namespace corona
