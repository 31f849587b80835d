#pragma once

#include <filesystem>
#include <optional>

/**
 * Initializes the spdlog default logger used by GmShim.
 * Messages go to a colored stderr sink and, if @p logFile is given, to that
 * file as well.
 *
 * @param logFile Optional path of an additional log file.
 *
 * @note Calling it twice is harmless, the second call only adds the file
 * sink if none was installed yet.
 */
extern void GmShim_SpdlogInit(
    const std::optional<std::filesystem::path>& logFile = std::nullopt);

// Deregister and cleanup spdlog
extern void GmShim_SpdlogDeInit();
