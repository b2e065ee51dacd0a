#pragma once

[[noreturn]] void permits_exit(int code);
