// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

namespace reelsplit::core {

// Visitor built from lambdas, one per alternative
template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace reelsplit::core
