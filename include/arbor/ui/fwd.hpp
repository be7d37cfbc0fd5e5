#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for arbor_ui

#include <cstdint>

namespace arbor_ui {

// Geometry
struct Point;
struct Size;
struct Rect;

// Identity
struct NodeId;
enum class NodeKind : std::uint8_t;

// Style
struct Dimension;
struct Edges;
struct Style;
class StyleResolver;

// Tree
struct NodeDesc;
struct Node;
struct TreeEdit;
struct ReconcileReport;
class NodeTree;

// Events
enum class EventKind : std::uint8_t;
enum class Key : std::uint32_t;
enum class KeyMod : std::uint32_t;
enum class PointerButton : std::uint8_t;
enum class ScrollAxis : std::uint8_t;
struct Event;

// Text
class TextMetrics;
class MonospaceTextMetrics;

// Layout
struct LayoutBox;
struct LayoutInput;
struct LayoutOutput;
struct LayoutReport;
class LayoutEngine;
class LayoutAdapter;

// Interaction
class HitTester;
struct InteractionState;
struct TextPosition;
class SelectionManager;
struct DispatchConfig;
class EventDispatcher;

} // namespace arbor_ui
