#pragma once

#include <optional>
#include <string>

namespace posmon {
namespace domain {

// -----------------------------------------------------------------------------
// SinkKind — the closed set of notification capabilities
// -----------------------------------------------------------------------------
// The set is fixed; adding a channel means adding an enumerator, a sink type
// in notify/sinks.hpp and a variant alternative. There is no plugin registry.
// -----------------------------------------------------------------------------
enum class SinkKind {
  DesktopNotification,
  AudibleAlert,
  ModalPopup,
  VisualTable,
};

inline const char* sinkKindName(SinkKind kind) {
  switch (kind) {
    case SinkKind::DesktopNotification: return "desktop_notification";
    case SinkKind::AudibleAlert:        return "audible_alert";
    case SinkKind::ModalPopup:          return "modal_popup";
    case SinkKind::VisualTable:         return "visual_table";
  }
  return "unknown";
}

// Inverse of sinkKindName(). Used by the config loader for the "sinks" array.
inline std::optional<SinkKind> parseSinkKind(const std::string& name) {
  if (name == "desktop_notification") return SinkKind::DesktopNotification;
  if (name == "audible_alert")        return SinkKind::AudibleAlert;
  if (name == "modal_popup")          return SinkKind::ModalPopup;
  if (name == "visual_table")         return SinkKind::VisualTable;
  return std::nullopt;
}

}  // namespace domain
}  // namespace posmon
