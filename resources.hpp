#pragma once
#include <string>

// ------------------------------------------------------------
// Constants
// ------------------------------------------------------------
inline constexpr const char* VOICE_CONFIG_FILE = "voice_config.json";

// ------------------------------------------------------------
// Resource loading
// ------------------------------------------------------------
// $VOXSTREAM_RESOURCES, else resources/ next to the executable (portable
// builds) or the project; falls back to the working directory.
std::string getResourcePath();

// Whole file as bytes; empty string if it cannot be read
std::string loadBinaryResource(const std::string& path);
