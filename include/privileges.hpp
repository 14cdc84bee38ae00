#pragma once
#include <string>

// Switch to the given account's gid then uid. Unknown user or a non-root
// process: nothing happens. A failing setgid/setuid is logged, not thrown.
void drop_privileges(const std::string& user);
