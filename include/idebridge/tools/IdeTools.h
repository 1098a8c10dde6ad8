//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: IdeTools.h
// Purpose: Editor-integration tools served on the WebSocket transport only
//==========================================================================================================

#pragma once

#include <vector>

#include "idebridge/HostServices.h"
#include "idebridge/ToolRegistry.h"

namespace idebridge {
namespace tools {

// openDiff, close_tab and closeAllDiffTabs acknowledge without side effects; getDiagnostics
// reports an empty diagnostics list plus workspace system info.
std::vector<ToolDefinition> IdeToolDefinitions();

void RegisterIdeTools(ToolRegistry& registry, const HostServices& host);

} // namespace tools
} // namespace idebridge
