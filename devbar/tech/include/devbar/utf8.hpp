#pragma once

#include <string_view>

namespace devbar {

// Strict UTF-8 validation (RFC 3629): rejects overlong forms, surrogates and code points above U+10FFFF.
bool IsValidUtf8(std::string_view data) noexcept;

}  // namespace devbar
