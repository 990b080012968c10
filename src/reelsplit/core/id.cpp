// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/core/id.hpp>
#include <uuid/uuid.h>

namespace reelsplit::core {

std::string generate_id() {
    uuid_t uuid;
    uuid_generate_random(uuid);
    char text[37];
    uuid_unparse_lower(uuid, text);
    return text;
}

} // namespace reelsplit::core
