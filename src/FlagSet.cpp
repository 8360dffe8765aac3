/**
 * @file FlagSet.cpp
 * @brief Flag registration and cxxopts glue
 */

#include "cfgbind/FlagSet.hpp"

#include <cxxopts.hpp>

#include <algorithm>
#include <sstream>

namespace cfgbind {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string quoted_default(const Flag& flag) {
    if (flag.kind == FieldKind::String) {
        return "\"" + flag.default_text + "\"";
    }
    return flag.default_text;
}

} // anonymous namespace

std::string render_flag_value(const FlagTarget& target) {
    return std::visit(overloaded{
        [](std::monostate) { return std::string(); },
        [](bool* p) { return std::string(*p ? "true" : "false"); },
        [](std::string* p) { return *p; },
        [](int* p) { return std::to_string(*p); },
        [](double* p) { return Value(*p).dump(); },
    }, target);
}

FieldKind flag_kind(const FlagTarget& target) {
    return std::visit(overloaded{
        [](std::monostate) { return FieldKind::Unsupported; },
        [](bool*) { return FieldKind::Boolean; },
        [](std::string*) { return FieldKind::String; },
        [](int*) { return FieldKind::Integer; },
        [](double*) { return FieldKind::Float; },
    }, target);
}

Flag& FlagSet::add(const std::string& name, FlagTarget target, const std::string& usage) {
    const bool null_target = std::visit(overloaded{
        [](std::monostate) { return true; },
        [](auto* p) { return p == nullptr; },
    }, target);
    if (null_target) {
        throw InvalidTargetKind("flag '" + name + "' has no target");
    }

    Flag flag;
    flag.name = name;
    flag.usage = usage;
    flag.kind = flag_kind(target);
    flag.target = target;
    flag.default_text = render_flag_value(target);

    if (Flag* existing = lookup(name)) {
        *existing = std::move(flag);
        return *existing;
    }
    flags_.push_back(std::move(flag));
    return flags_.back();
}

Flag* FlagSet::lookup(const std::string& name) {
    auto it = std::find_if(flags_.begin(), flags_.end(),
                           [&name](const Flag& f) { return f.name == name; });
    return it == flags_.end() ? nullptr : &*it;
}

const Flag* FlagSet::lookup(const std::string& name) const {
    auto it = std::find_if(flags_.begin(), flags_.end(),
                           [&name](const Flag& f) { return f.name == name; });
    return it == flags_.end() ? nullptr : &*it;
}

bool FlagSet::changed(const std::string& name) const {
    const Flag* flag = lookup(name);
    return flag != nullptr && flag->changed;
}

void FlagSet::refresh_default(const std::string& name) {
    if (Flag* flag = lookup(name)) {
        flag->default_text = render_flag_value(flag->target);
    }
}

void FlagSet::refresh_defaults() {
    for (auto& flag : flags_) {
        flag.default_text = render_flag_value(flag.target);
    }
}

void FlagSet::reset_changed() {
    for (auto& flag : flags_) {
        flag.changed = false;
    }
}

void FlagSet::add_to(cxxopts::Options& options, const std::string& group) const {
    auto adder = options.add_options(group);
    for (const auto& flag : flags_) {
        std::visit(overloaded{
            [](std::monostate) {},
            [&](bool* p) {
                adder(flag.name, flag.usage,
                      cxxopts::value<bool>(*p)->default_value(*p ? "true" : "false")
                                              ->implicit_value("true"));
            },
            [&](std::string* p) { adder(flag.name, flag.usage, cxxopts::value<std::string>(*p)); },
            [&](int* p) { adder(flag.name, flag.usage, cxxopts::value<int>(*p)); },
            [&](double* p) { adder(flag.name, flag.usage, cxxopts::value<double>(*p)); },
        }, flag.target);
    }
}

void FlagSet::collect_changed(const cxxopts::ParseResult& result) {
    for (auto& flag : flags_) {
        flag.changed = result.count(flag.name) > 0;
    }
}

std::string FlagSet::usage_lines() const {
    std::vector<std::string> heads;
    heads.reserve(flags_.size());
    std::size_t width = 0;
    for (const auto& flag : flags_) {
        std::string head = "      --" + flag.name;
        if (flag.kind != FieldKind::Boolean) {
            head += " ";
            head += kind_name(flag.kind);
        }
        width = std::max(width, head.size());
        heads.push_back(std::move(head));
    }

    std::ostringstream oss;
    for (std::size_t i = 0; i < flags_.size(); ++i) {
        const Flag& flag = flags_[i];
        oss << heads[i] << std::string(width - heads[i].size() + 3, ' ') << flag.usage;
        const bool zero_default = flag.default_text.empty() || flag.default_text == "false" ||
                                  flag.default_text == "0";
        if (!zero_default) {
            if (!flag.usage.empty()) oss << ' ';
            oss << "(default " << quoted_default(flag) << ")";
        }
        oss << "\n";
    }
    return oss.str();
}

} // namespace cfgbind
