#pragma once

#ifndef GITPROMPTS_VERSION
#define GITPROMPTS_VERSION "1.0.0"
#endif

inline constexpr const char* kServerName = "git_prompts_mcp_server";
inline constexpr const char* kServerVersion = GITPROMPTS_VERSION;
