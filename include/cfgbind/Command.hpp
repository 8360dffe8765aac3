/**
 * @file Command.hpp
 * @brief Hierarchical command tree with persistent flags and hooks
 *
 * A small cobra-style command tree:
 * - every node owns its children and one persistent flag set
 * - dispatch consumes command words from the front of the argument list,
 *   then parses the flags of every node on the root->target path
 * - the resolver of every node on the root->target path is called, in
 *   root->target order, before any hook, help function or run action
 * - before the run action, the persistent pre-run hook of the nearest
 *   node (target first, then ancestors) is called
 * - `--help`, or a target without run action, calls the nearest help
 *   function instead
 */

#ifndef CFGBIND_COMMAND_HPP
#define CFGBIND_COMMAND_HPP

#include "cfgbind/FlagSet.hpp"

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace cfgbind {

class Command;

/**
 * @brief Hook and action signature: (executing command, positional args)
 */
using Hook = std::function<void(Command&, const std::vector<std::string>&)>;

/**
 * @brief Per-node step run before dispatch, called with the target command
 */
using Resolver = std::function<void(Command& target)>;

class Command {
public:
    explicit Command(std::string name, std::string short_help = "");

    Command(const Command&) = delete;
    Command& operator=(const Command&) = delete;

    const std::string& name() const noexcept { return name_; }
    const std::string& short_help() const noexcept { return short_help_; }

    // ========================================================================
    // Tree
    // ========================================================================

    Command* parent() const noexcept { return parent_; }

    /**
     * @brief Top of the tree this node belongs to
     */
    Command& root();
    const Command& root() const;

    /**
     * @brief Space-separated names from the root, e.g. "app child1 child2"
     */
    std::string command_path() const;

    /**
     * @brief Nodes from the root down to this one (inclusive)
     */
    std::vector<Command*> path_from_root();

    /**
     * @brief Adopt a child command
     * @return Reference to the adopted child
     */
    Command& add_command(std::unique_ptr<Command> child);

    /**
     * @brief Create and adopt a child command
     */
    Command& add_command(std::string name, std::string short_help = "");

    Command* find_child(const std::string& name) const;

    /**
     * @brief Descend by command words, e.g. {"child1", "child2"}
     * @return The node, or nullptr if a word names no child
     */
    Command* find(const std::vector<std::string>& words);

    const std::vector<std::unique_ptr<Command>>& commands() const noexcept { return children_; }

    // ========================================================================
    // Flags and hooks
    // ========================================================================

    FlagSet& persistent_flags() noexcept { return flags_; }
    const FlagSet& persistent_flags() const noexcept { return flags_; }

    void set_run(Hook run) { run_ = std::move(run); }
    void set_persistent_pre_run(Hook hook) { pre_run_ = std::move(hook); }
    void set_help_func(Hook help) { help_ = std::move(help); }

    /**
     * @brief Set the node's resolver
     *
     * Independent of the pre-run hook and help function: replacing those
     * never removes it.
     */
    void set_resolver(Resolver resolver) { resolver_ = std::move(resolver); }

    const Hook& run_action() const noexcept { return run_; }
    const Hook& persistent_pre_run() const noexcept { return pre_run_; }
    const Hook& help_func() const noexcept { return help_; }
    const Resolver& resolver() const noexcept { return resolver_; }

    // ========================================================================
    // Output
    // ========================================================================

    void set_out(std::ostream& out) { out_ = &out; }
    void set_err(std::ostream& err) { err_ = &err; }

    /**
     * @brief Output stream; inherited from the parent, std::cout at the root
     */
    std::ostream& out() const;

    /**
     * @brief Error stream; inherited from the parent, std::cerr at the root
     */
    std::ostream& err() const;

    // ========================================================================
    // Dispatch
    // ========================================================================

    /**
     * @brief Number of dispatches started from this node's root
     */
    std::uint64_t dispatch_serial() const noexcept { return root().serial_; }

    /**
     * @brief Dispatch an argument list (without program name) from the root
     *
     * @throws FlagParseError on unknown flags or bad flag values
     * @throws Anything a hook or run action throws
     */
    void execute(const std::vector<std::string>& args);

    /**
     * @brief Dispatch argv, reporting errors on the error stream
     * @return 0 on success, 1 on error
     */
    int run(int argc, const char* const* argv);

    /**
     * @brief Default usage printer
     */
    void print_help();

private:
    Command* locate(std::vector<std::string>& args);
    const Flag* find_path_flag(const std::string& name);
    bool parse_flags(const std::vector<std::string>& args, std::vector<std::string>& positionals);
    const Hook* nearest_pre_run() const;
    const Hook* nearest_help() const;

    std::string name_;
    std::string short_help_;
    Command* parent_ = nullptr;
    std::vector<std::unique_ptr<Command>> children_;
    FlagSet flags_;
    Hook run_;
    Hook pre_run_;
    Hook help_;
    Resolver resolver_;
    std::ostream* out_ = nullptr;
    std::ostream* err_ = nullptr;
    std::uint64_t serial_ = 0;
};

} // namespace cfgbind

#endif // CFGBIND_COMMAND_HPP
