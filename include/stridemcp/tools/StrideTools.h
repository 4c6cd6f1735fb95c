//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StrideTools.h
// Purpose: STRIDE threat modeling tool set
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "stridemcp/ToolRegistry.h"

namespace stridemcp {
namespace tools {

//==========================================================================================================
// RegisterStrideTools
// Purpose: Register the eight STRIDE threat modeling tools, in this order:
//            get_stride_threat_framework, generate_threat_mitigations, create_threat_attack_trees,
//            calculate_threat_risk_scores, generate_security_tests, generate_threat_report,
//            validate_threat_coverage, get_repository_analysis_guide
//          Handlers are pure: they combine static guidance frameworks with the caller's options.
// Args:
//   registry: Registry under construction.
// Throws:
//   std::invalid_argument when a tool of the same name is already registered.
//==========================================================================================================
void RegisterStrideTools(ToolRegistry& registry);

// Names registered by RegisterStrideTools, in registration order.
const std::vector<std::string>& StrideToolNames();

} // namespace tools
} // namespace stridemcp
