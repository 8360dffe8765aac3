/**
 * @file Command.cpp
 * @brief Command tree dispatch and help output
 */

#include "cfgbind/Command.hpp"
#include "cfgbind/Errors.hpp"

#include <cxxopts.hpp>

#include <algorithm>
#include <iostream>

namespace cfgbind {

namespace {

void reset_changed_recursive(Command& node) {
    node.persistent_flags().reset_changed();
    for (const auto& child : node.commands()) {
        reset_changed_recursive(*child);
    }
}

bool is_flag_word(const std::string& arg) {
    return arg.size() > 1 && arg[0] == '-';
}

} // anonymous namespace

Command::Command(std::string name, std::string short_help)
    : name_(std::move(name))
    , short_help_(std::move(short_help))
{}

// ============================================================================
// Tree
// ============================================================================

Command& Command::root() {
    Command* node = this;
    while (node->parent_ != nullptr) node = node->parent_;
    return *node;
}

const Command& Command::root() const {
    const Command* node = this;
    while (node->parent_ != nullptr) node = node->parent_;
    return *node;
}

std::string Command::command_path() const {
    if (parent_ == nullptr) return name_;
    return parent_->command_path() + " " + name_;
}

std::vector<Command*> Command::path_from_root() {
    std::vector<Command*> path;
    for (Command* node = this; node != nullptr; node = node->parent_) {
        path.push_back(node);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

Command& Command::add_command(std::unique_ptr<Command> child) {
    child->parent_ = this;
    children_.push_back(std::move(child));
    return *children_.back();
}

Command& Command::add_command(std::string name, std::string short_help) {
    return add_command(std::make_unique<Command>(std::move(name), std::move(short_help)));
}

Command* Command::find_child(const std::string& name) const {
    for (const auto& child : children_) {
        if (child->name_ == name) return child.get();
    }
    return nullptr;
}

Command* Command::find(const std::vector<std::string>& words) {
    Command* node = this;
    for (const auto& word : words) {
        node = node->find_child(word);
        if (node == nullptr) return nullptr;
    }
    return node;
}

// ============================================================================
// Output
// ============================================================================

std::ostream& Command::out() const {
    for (const Command* node = this; node != nullptr; node = node->parent_) {
        if (node->out_ != nullptr) return *node->out_;
    }
    return std::cout;
}

std::ostream& Command::err() const {
    for (const Command* node = this; node != nullptr; node = node->parent_) {
        if (node->err_ != nullptr) return *node->err_;
    }
    return std::cerr;
}

// ============================================================================
// Dispatch
// ============================================================================

const Flag* Command::find_path_flag(const std::string& name) {
    for (Command* node = this; node != nullptr; node = node->parent_) {
        if (const Flag* flag = node->flags_.lookup(name)) return flag;
    }
    return nullptr;
}

Command* Command::locate(std::vector<std::string>& args) {
    Command* current = this;
    std::vector<std::string> rest;
    bool descending = true;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--") {
            rest.insert(rest.end(), args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
            break;
        }
        if (is_flag_word(arg)) {
            rest.push_back(arg);
            // "--name value": keep the value away from command matching
            if (arg.rfind("--", 0) == 0 && arg.find('=') == std::string::npos) {
                const Flag* flag = current->find_path_flag(arg.substr(2));
                if (flag != nullptr && flag->kind != FieldKind::Boolean && i + 1 < args.size()) {
                    rest.push_back(args[++i]);
                }
            }
            continue;
        }
        if (descending) {
            if (Command* child = current->find_child(arg)) {
                current = child;
                continue;
            }
            descending = false;
        }
        rest.push_back(arg);
    }

    args = std::move(rest);
    return current;
}

bool Command::parse_flags(const std::vector<std::string>& args,
                          std::vector<std::string>& positionals) {
    const auto path = path_from_root();
    bool help = false;

    try {
        cxxopts::Options options(root().name(), short_help_);
        for (Command* node : path) {
            node->flags_.add_to(options);
        }
        options.add_options()("h,help", "help for " + name_, cxxopts::value<bool>(help));

        std::vector<const char*> argv;
        argv.reserve(args.size() + 1);
        argv.push_back(root().name().c_str());
        for (const auto& arg : args) {
            argv.push_back(arg.c_str());
        }

        const auto result = options.parse(static_cast<int>(argv.size()), argv.data());
        for (Command* node : path) {
            node->flags_.collect_changed(result);
        }
        positionals = result.unmatched();
    } catch (const std::exception& e) {
        throw FlagParseError(command_path() + ": " + e.what());
    }

    return help;
}

const Hook* Command::nearest_pre_run() const {
    for (const Command* node = this; node != nullptr; node = node->parent_) {
        if (node->pre_run_) return &node->pre_run_;
    }
    return nullptr;
}

const Hook* Command::nearest_help() const {
    for (const Command* node = this; node != nullptr; node = node->parent_) {
        if (node->help_) return &node->help_;
    }
    return nullptr;
}

void Command::execute(const std::vector<std::string>& args) {
    if (parent_ != nullptr) {
        root().execute(args);
        return;
    }

    ++serial_;
    reset_changed_recursive(*this);

    std::vector<std::string> rest = args;
    Command* target = locate(rest);

    std::vector<std::string> positionals;
    const bool help = target->parse_flags(rest, positionals);

    for (Command* node : target->path_from_root()) {
        if (node->resolver_) node->resolver_(*target);
    }

    if (help || !target->run_) {
        if (const Hook* hook = target->nearest_help()) {
            (*hook)(*target, positionals);
        } else {
            target->print_help();
        }
        return;
    }

    if (const Hook* hook = target->nearest_pre_run()) {
        (*hook)(*target, positionals);
    }
    target->run_(*target, positionals);
}

int Command::run(int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    try {
        execute(args);
    } catch (const std::exception& e) {
        err() << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

void Command::print_help() {
    std::ostream& os = out();

    if (!short_help_.empty()) {
        os << short_help_ << "\n\n";
    }

    os << "Usage:\n";
    if (run_ || children_.empty()) {
        os << "  " << command_path() << " [flags]\n";
    }
    if (!children_.empty()) {
        os << "  " << command_path() << " [command]\n";

        std::size_t width = 0;
        for (const auto& child : children_) {
            width = std::max(width, child->name_.size());
        }
        os << "\nAvailable Commands:\n";
        for (const auto& child : children_) {
            os << "  " << child->name_ << std::string(width - child->name_.size() + 2, ' ')
               << child->short_help_ << "\n";
        }
    }

    os << "\nFlags:\n" << flags_.usage_lines() << "  -h, --help   help for " << name_ << "\n";

    std::string global;
    for (Command* node : path_from_root()) {
        if (node != this) global += node->flags_.usage_lines();
    }
    if (!global.empty()) {
        os << "\nGlobal Flags:\n" << global;
    }

    if (!children_.empty()) {
        os << "\nUse \"" << command_path() << " [command] --help\" for more information about a command.\n";
    }
}

} // namespace cfgbind
