#pragma once
#include <fmt/core.h>
#include <fmt/format.h>
namespace uma::compat {
using fmt::format;
}
