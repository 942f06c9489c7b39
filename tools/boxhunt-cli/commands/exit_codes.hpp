#pragma once

namespace boxhunt::cli {

// Process exit codes; BOXHUNT_ prefix keeps clear of EXIT_SUCCESS and friends
constexpr int BOXHUNT_EXIT_SUCCESS = 0;
constexpr int BOXHUNT_EXIT_USER_ERROR = 1;   // Bad arguments, no API keys, robots.txt refusal
constexpr int BOXHUNT_EXIT_NOT_FOUND = 2;    // Seed page or file missing
constexpr int BOXHUNT_EXIT_IO_ERROR = 3;     // Disk, network or provider failure
constexpr int BOXHUNT_EXIT_INTERNAL = 4;

}  // namespace boxhunt::cli
