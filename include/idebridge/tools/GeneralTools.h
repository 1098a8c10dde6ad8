//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GeneralTools.h
// Purpose: File and workspace tools shared by both transports
//==========================================================================================================

#pragma once

#include <vector>

#include "idebridge/HostServices.h"
#include "idebridge/ToolRegistry.h"

namespace idebridge {
namespace tools {

//==========================================================================================================
// GeneralToolDefinitions
// Purpose: Definitions of get_current_file, get_workspace_files (workspace) and view, str_replace,
//          create, insert (file).
//==========================================================================================================
std::vector<ToolDefinition> GeneralToolDefinitions();

//==========================================================================================================
// RegisterGeneralTools
// Purpose: Registers every general tool into registry, bound to the given host collaborators.
// Throws:
//   errors::RegistrationError when the registry rejects a tool.
//==========================================================================================================
void RegisterGeneralTools(ToolRegistry& registry, const HostServices& host);

} // namespace tools
} // namespace idebridge
