// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>

namespace reelsplit::core {

// Random RFC 4122 identifier, lowercase text form
[[nodiscard]] std::string generate_id();

} // namespace reelsplit::core
