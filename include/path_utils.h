#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution: ~ expansion and the default config location
 */

#include <string>

namespace call_relay {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Config file used when none is given on the command line:
 * <exe dir>/../config/config.json when it exists, else config/config.json
 */
std::string default_config_path();

} // namespace call_relay
