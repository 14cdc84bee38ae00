#include "privileges.hpp"
#include "log.hpp"
#include <cerrno>
#include <cstring>
#include <grp.h>
#include <pwd.h>
#include <unistd.h>

void drop_privileges(const std::string& user) {
  if (user.empty() || geteuid() != 0) return;

  struct passwd* pw = getpwnam(user.c_str());
  if (!pw) {
    log_debug("privileges", "No such user \"", user, "\", keeping current privileges");
    return;
  }
  // gid must go first: after setuid we may no longer change it
  if (setgroups(0, nullptr) != 0 && errno != EPERM) {
    log_warn("privileges", "Failed to clear supplementary groups: ", std::strerror(errno));
  }
  if (setgid(pw->pw_gid) != 0) {
    log_warn("privileges", "Failed to drop user privileges: setgid ", pw->pw_gid, ": ", std::strerror(errno));
    return;
  }
  if (setuid(pw->pw_uid) != 0) {
    log_warn("privileges", "Failed to drop user privileges: setuid ", pw->pw_uid, ": ", std::strerror(errno));
    return;
  }
  log_info("privileges", "Now running as ", user);
}
