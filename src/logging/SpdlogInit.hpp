#pragma once

#include <filesystem>
#include <string_view>

/**
 * Initializes the spdlog logger used by the assistant bot.
 * Logs go to stderr, defaulting to warnings and above so the interactive
 * session on stdout is not interleaved with chatter.
 *
 * @note Calling this more than once is a no-op.
 */
extern void AssistantBot_SpdlogInit();

/**
 * Changes the level of the default logger.
 *
 * @param level One of trace, debug, info, warn, error, critical, off.
 * @return false if the level name is not recognized, and the level is kept.
 */
extern bool AssistantBot_SpdlogSetLevel(std::string_view level);

/**
 * Appends a file sink to the default logger, so that logs are also written
 * to the given file.
 *
 * @return false if the file could not be opened.
 */
extern bool AssistantBot_SpdlogAddFileSink(const std::filesystem::path& path);

// Deregister and cleanup spdlog
extern void AssistantBot_SpdlogDeInit();
