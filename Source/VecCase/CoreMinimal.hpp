// =============================
// CoreMinimal.hpp
// =============================
#pragma once

// This header is the minimal set of includes that any file in VecCase can include safely.
// Only headers with ZERO project dependencies and stable purpose should be included here.
//
// Intent: Cross-platform, lightweight, no side effects, no runtime logic.

#include "VecCase/Platform/PlatformDefines.hpp"   // Platform, arch and ISA flags
#include "VecCase/Platform/PlatformCompiler.hpp"  // Compiler detection, FORCEINLINE, NOINLINE
#include "VecCase/Platform/PlatformMacros.hpp"    // Likely, Unlikely
#include "VecCase/Types.hpp"                      // Core typedefs (u8, usize, ...)
#include "VecCase/Logger.hpp"                     // Basic logging system (safe for all modules)
