#include <cstdio>
#include <cstdlib>
#include <unistd.h>
#include "permits/common/config.hpp"
#include "permits/common/exit.hpp"
#include "permits/common/log.hpp"

void permits_exit(int code) {
    if (g_config.sleep_on_error) {
        int pid = getpid();
        PLAIN("I have crashed! My PID is %d, you have 40 seconds to attach gdb using `gdb -p %d` to find out why!", pid, pid);
        sleep(40);
    }

    exit(code);
}
