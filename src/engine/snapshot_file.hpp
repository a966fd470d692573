#pragma once

#include <string>

#include "common/models.hpp"

namespace keepsake {

// "keepsake@<version>", written into every snapshot header.
std::string creatorString();

// Snapshot files are a "---" delimited header of `key: "json string"` lines
// followed by the body:
//
//   ---
//   creator: "keepsake@0.1.0"
//   source: "tests/test_users.cpp:42"
//   expression: "user"
//   snapshot: "users__login"
//   ---
//   <body>
//
// A file that does not start with a header is read as body only.
std::string serializeSnapshotFile(const SnapshotFile &file);
SnapshotFile parseSnapshotFile(const std::string &text);

} // namespace keepsake
