/**
 * @file FlagSet.hpp
 * @brief Typed, mutable flag bindings of one command node
 *
 * A Flag writes straight into a record field: parsing `--fifth-param 102`
 * stores 102 in the int the flag targets. Parsing itself is done by
 * cxxopts; a FlagSet only contributes its options to a cxxopts::Options
 * and reads back which flags the command line set.
 */

#ifndef CFGBIND_FLAGSET_HPP
#define CFGBIND_FLAGSET_HPP

#include "cfgbind/Record.hpp"

#include <deque>
#include <string>

namespace cxxopts {
class Options;
class ParseResult;
} // namespace cxxopts

namespace cfgbind {

/**
 * @brief One registered flag
 */
struct Flag {
    std::string name;          ///< Long name without dashes
    std::string usage;
    FieldKind kind = FieldKind::Unsupported;
    FlagTarget target;
    std::string default_text;  ///< Default shown in help
    bool changed = false;      ///< Set explicitly by the last parse
};

/**
 * @brief Current value of a flag target as command-line text
 */
std::string render_flag_value(const FlagTarget& target);

/**
 * @brief Kind of a flag target (Unsupported for std::monostate)
 */
FieldKind flag_kind(const FlagTarget& target);

/**
 * @brief Flags of one command node, in registration order
 *
 * References returned by add() and lookup() stay valid as more flags are
 * added.
 */
class FlagSet {
public:
    /**
     * @brief Register a flag
     *
     * The default text is the target's current value. Registering a name
     * that already exists replaces the earlier flag.
     *
     * @throws InvalidTargetKind if `target` holds no pointer
     */
    Flag& add(const std::string& name, FlagTarget target, const std::string& usage = "");

    Flag* lookup(const std::string& name);
    const Flag* lookup(const std::string& name) const;

    /**
     * @brief Whether the last parse set the named flag
     */
    bool changed(const std::string& name) const;

    /**
     * @brief Re-read the default text of one flag from its target
     */
    void refresh_default(const std::string& name);

    /**
     * @brief Re-read the default text of every flag from its target
     */
    void refresh_defaults();

    void reset_changed();

    bool empty() const noexcept { return flags_.empty(); }
    std::size_t size() const noexcept { return flags_.size(); }
    const std::deque<Flag>& flags() const noexcept { return flags_; }

    /**
     * @brief Add every flag to a cxxopts option table
     *
     * Values are bound to the flag targets. Boolean flags default to the
     * field's current value; other kinds have no cxxopts default, so an
     * absent flag never touches its field.
     */
    void add_to(cxxopts::Options& options, const std::string& group = "") const;

    /**
     * @brief Mark flags that appear in a parse result as changed
     */
    void collect_changed(const cxxopts::ParseResult& result);

    /**
     * @brief Help lines, one per flag: "      --name type   usage (default x)"
     */
    std::string usage_lines() const;

private:
    std::deque<Flag> flags_;
};

} // namespace cfgbind

#endif // CFGBIND_FLAGSET_HPP
