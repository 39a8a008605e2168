#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace blobseal::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Unknown names yield default_level.
Level ParseLevel(std::string_view name, Level default_level = Level::Warn);
std::string_view LevelName(Level level);

void SetLevel(Level level);
Level GetLevel();
bool Enabled(Level level);

// Redirect output; nullptr restores std::cerr.
void SetStream(std::ostream* stream);

void Write(Level level, std::string_view message);
inline void Debug(std::string_view message) { Write(Level::Debug, message); }
inline void Info(std::string_view message) { Write(Level::Info, message); }
inline void Warn(std::string_view message) { Write(Level::Warn, message); }
inline void Error(std::string_view message) { Write(Level::Error, message); }

}  // namespace blobseal::log
