#pragma once

namespace exitc
{
constexpr int ok        = 0;
constexpr int bad_args  = 2;
constexpr int no_server = 3;
constexpr int failed    = 4;
}  // namespace exitc
