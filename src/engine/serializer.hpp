#pragma once

#include <string>

#include "common/content.hpp"
#include "common/enums.hpp"

namespace keepsake {

// Renders a content tree as snapshot text. Output is a pure function of the
// tree and the format. Json and Yaml drop struct type names and enum type
// names; Ron keeps both.
//
// Throws SerializationError when the tree cannot be expressed in the format
// (e.g. a composite map key or invalid UTF-8 in Json).
std::string renderContent(const Content &content, SnapshotFormat format);

} // namespace keepsake
