#pragma once

namespace exitc
{
constexpr int ok        = 0;
constexpr int bad_args  = 2;
constexpr int no_server = 3;
constexpr int rpc_error = 4;  // daemon answered with ERR
}  // namespace exitc
