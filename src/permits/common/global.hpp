#pragma once

#include "permits/common/utility.hpp"

extern int g_output_fd;
extern bool g_quiet;
extern bool g_verbose;

void initialize_globals();
