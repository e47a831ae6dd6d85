#pragma once

#include <string>

// Turns directory `path` into `path.tar` holding its contents, then removes
// the directory. Paths that already carry an extension are refused before
// anything is read or written.
void create_in_place(const std::string& path);

// Turns `name.tar` into directory `name`, then removes the archive. The
// archive is left untouched if extraction fails.
void extract_in_place(const std::string& path);
