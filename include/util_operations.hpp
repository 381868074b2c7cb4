// File: util_operations.hpp

#pragma once
#define FUSE_USE_VERSION 35
#include <fuse3/fuse_lowlevel.h>

// Extended attribute exposing the resolved download URL of a file.
inline constexpr const char *kLinkXattr = "user.rdfs.link";

void fs_getxattr(fuse_req_t req, fuse_ino_t ino, const char *name, size_t size);
