#pragma once

#include <cstddef>
#include <cstdint>

namespace termdeck
{

// Stable window identifier, unique per open window for the process lifetime.
using WindowId = uint32_t;

// Stable tab identifier, unique within its owning window.
using TabId = uint64_t;

inline constexpr WindowId INVALID_WINDOW_ID = 0;
inline constexpr TabId    INVALID_TAB_ID    = 0;

class Surface;
class SurfaceTree;
class TerminalEngine;

class Tab;
class Notebook;
class Window;
class WindowRegistry;
class ActionDispatcher;
class CloseConfirmation;
class Keybindings;

class Toolkit;
class ToolkitWindow;

struct WindowConfig;
struct WindowCapabilities;

}   // namespace termdeck
