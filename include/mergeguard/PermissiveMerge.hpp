/**
 * @file PermissiveMerge.hpp
 * @brief The unsanitized legacy merge, kept as a negative control
 *
 * permissive_merge() behaves like the naive recursive merges found in
 * many libraries: it writes every key it is given, and keys that alias
 * the shared ancestor ("__proto__", or "constructor" followed by
 * "prototype") write into the ambient namespace. Against an installed
 * guard it throws AmbientFrozenError.
 *
 * Never use it on untrusted input. It exists so tests and the CLI can
 * show what merge() prevents.
 */

#ifndef MERGEGUARD_PERMISSIVE_MERGE_HPP
#define MERGEGUARD_PERMISSIVE_MERGE_HPP

#include "mergeguard/Ambient.hpp"
#include "mergeguard/Value.hpp"
#include <cstddef>

namespace mergeguard {

/**
 * @brief Merge source into target in place without any checks
 *
 * @return Number of ambient namespace slots written
 * @throws AmbientFrozenError if ns is installed and the source aliases it
 */
std::size_t permissive_merge(Value& target, const Value& source, AmbientNamespace& ns);

} // namespace mergeguard

#endif // MERGEGUARD_PERMISSIVE_MERGE_HPP
