#pragma once

#include <string>
#include <filesystem>
#include <functional>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Run handler (once per signal) when the user presses Ctrl-C.
// The handler runs on a dedicated thread, not inside the signal context.
void on_interrupt(std::function<void()> handler);

// Restore default Ctrl-C behaviour and stop the interrupt thread.
void remove_interrupt();

} // namespace platform
