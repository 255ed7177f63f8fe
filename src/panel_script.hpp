#pragma once
/*
 * PanelScript
 *
 * Purpose: configure a PanelBuilder from a line-oriented script.
 * Format: one command per line, '#' starts a comment line:
 *   title <text>            borders all|none|top|bottom|left|right ...
 *   padding <n> | <h> <v> | <l> <r> <t> <b>
 *   scrollbar on|off        spacer <rows>
 *   text <policy> <text>    (policy: truncate ellipsis exact words justified centered right)
 * In text and title, "\n" is a newline and "\\" a backslash.
 * Errors: false with "<origin>:<line>: <reason>"; the builder may be partially filled.
 */
#include <string>
#include <vector>
#include <filesystem>
#include "panel.hpp"

bool apply_panel_script(const std::vector<std::string>& lines, PanelBuilder& builder,
                        const std::string& origin, std::string& msg);
bool load_panel_script(const std::filesystem::path& path, PanelBuilder& builder, std::string& msg);
