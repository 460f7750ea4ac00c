#pragma once
/**
 * @file version.hpp
 * @brief Library version, kept in step with project(unmanaged VERSION ...) in CMakeLists.txt.
 *
 * The demo prints version_string in its banner next to the tracking mode, so
 * a captured leak report can be matched to the build that produced it.
 */

namespace unmanaged {

inline constexpr int version_major = 0;
inline constexpr int version_minor = 3;
inline constexpr int version_patch = 0;

inline constexpr const char* version_string = "0.3.0";

} // namespace unmanaged
