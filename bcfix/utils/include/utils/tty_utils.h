#pragma once

#include <unistd.h>

#include <cstdio>

namespace bcfix::utils {

inline bool is_fd_tty(FILE* fd) { return isatty(fileno(fd)); }

}  // namespace bcfix::utils
