#pragma once

namespace gt::version
{

// Derived from GT_BUILD_VERSION, which the build passes in from the project
// version.
inline constexpr char const kSemanticVersion[] = GT_BUILD_VERSION;
inline constexpr char const kDisplayVersion[] = "gametimed " GT_BUILD_VERSION;

} // namespace gt::version
