#pragma once
///@file

#include "lbrun/util/error.hh"

#include <optional>
#include <string>
#include <string_view>

namespace lbrun {

/**
 * Parse a decimal integer. Returns nothing unless all of `s` is
 * consumed and the value fits in `N`.
 */
template<class N>
std::optional<N> string2Int(std::string_view s);

/**
 * The value of an environment variable, if it is set.
 */
std::optional<std::string> getEnv(const std::string & key);

/**
 * Like `getEnv()`, but an empty value counts as unset.
 */
std::optional<std::string> getEnvNonEmpty(const std::string & key);

/**
 * Call from a `catch (...)` block in a destructor: log the current
 * exception and carry on.
 */
void ignoreExceptionInDestructor(Verbosity lvl = lvlError);

} // namespace lbrun
