// orgdoc.hpp - Orgdoc
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// Orgdoc Core Principles:
//========================================================================
//
// The Lossless Principle
// ----------------------
// Every byte of the source belongs to exactly one token.
// Printing the tree gives back the text it was parsed from.
// Whitespace, blank lines and markers are content, not noise.
//
//
// The Total Parse Principle
// -------------------------
// Any text is a valid document.
// Constructs that do not close degrade to paragraphs.
// Parsing reports no errors because it has none to report.
//
//
// The Immutable Version Principle
// -------------------------------
// A tree, once built, never changes.
// An edit produces a new version that shares every untouched subtree.
// A cursor into an old version keeps seeing the old text.
//
//
// The View Principle
// ------------------
// Semantics are read off the tree, never stored beside it.
// A typed view is a node plus accessors; it cannot go stale.
//
//========================================================================

#ifndef ORGDOC_HPP
#define ORGDOC_HPP

#include "orgdoc_core.hpp"
#include "orgdoc_config.hpp"
#include "orgdoc_parser.hpp"
#include "orgdoc_ast.hpp"
#include "orgdoc_traverse.hpp"
#include "orgdoc_document.hpp"
#include "orgdoc_editor.hpp"
#include "orgdoc_serializer.hpp"
#include "orgdoc_html.hpp"
#include "orgdoc_markdown.hpp"
#include "orgdoc_interop.hpp"

#endif // ORGDOC_HPP
