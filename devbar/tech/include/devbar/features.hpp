#pragma once

namespace devbar {

// zlib (gzip, deflate) is mandatory, optional codecs are toggled by the build.

#ifdef DEVBAR_ENABLE_BROTLI
constexpr bool brotliEnabled() { return true; }
#else
constexpr bool brotliEnabled() { return false; }
#endif

#ifdef DEVBAR_ENABLE_ZSTD
constexpr bool zstdEnabled() { return true; }
#else
constexpr bool zstdEnabled() { return false; }
#endif

}  // namespace devbar
