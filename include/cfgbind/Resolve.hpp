/**
 * @file Resolve.hpp
 * @brief Precedence merge of flag-set values with store values
 *
 * Precedence, highest to lowest:
 *   explicit flag > config file / environment > compiled-in default
 *
 * apply_precedence() is called with the record as flag parsing left it:
 * 1. snapshot the record
 * 2. decode the store-sourced object onto it (present keys overwrite)
 * 3. put flag values from the snapshot back, per policy
 */

#ifndef CFGBIND_RESOLVE_HPP
#define CFGBIND_RESOLVE_HPP

#include "cfgbind/Merge.hpp"
#include "cfgbind/Record.hpp"

#include <set>
#include <string>

namespace cfgbind {

/**
 * @brief Which snapshot values count as "set by a flag"
 */
enum class Precedence {
    /**
     * Fields whose flag was given on the command line. An explicit zero,
     * false or empty value wins over the store.
     */
    ExplicitFlags,

    /**
     * Fields whose snapshot value is non-zero, recursively. A flag cannot
     * set a field back to zero against a non-zero store value, and a
     * non-zero compiled-in default wins over the store.
     */
    NonZeroFlags
};

/**
 * @brief Declared names of fields explicitly set on the command line
 */
using FieldSet = std::set<std::string>;

/**
 * @brief Merge a store-sourced object onto a flag-mutated record
 *
 * Reapplying with the same inputs gives the same result.
 *
 * @param target Record as mutated by flag parsing (modified in place)
 * @param source Store-sourced object (null means "nothing configured")
 * @param explicit_fields Fields set by flags (used by ExplicitFlags)
 * @param policy Snapshot policy
 * @throws DecodeError if `source` does not fit the record
 */
template <typename T>
void apply_precedence(T& target, const Value& source, const FieldSet& explicit_fields,
                      Precedence policy = Precedence::ExplicitFlags) {
    const T flag_snapshot = target;
    decode(source, target);

    switch (policy) {
        case Precedence::ExplicitFlags:
            for (const auto& field : describe<T>().fields()) {
                if (explicit_fields.count(field.name) > 0) {
                    field.copy(target, flag_snapshot);
                }
            }
            break;

        case Precedence::NonZeroFlags: {
            Value merged = encode(target);
            merge_onto(merged, encode(flag_snapshot), /*overwrite=*/true);
            decode(merged, target);
            break;
        }
    }
}

} // namespace cfgbind

#endif // CFGBIND_RESOLVE_HPP
