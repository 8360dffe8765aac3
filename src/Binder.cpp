/**
 * @file Binder.cpp
 * @brief Hook chain and collection selection
 */

#include "cfgbind/Binder.hpp"

namespace cfgbind {

const Value* select_element(const Value& items, const std::string& identifying_key,
                            const std::string& wanted) {
    if (wanted.empty() || !items.is_array()) {
        return nullptr;
    }
    for (const auto& item : items) {
        const Value* id = find_key_icase(item, identifying_key);
        if (id != nullptr && !id->is_null() && to_text(*id) == wanted) {
            return &item;
        }
    }
    return nullptr;
}

Binder::Binder(ConfigLoader& loader, Precedence policy)
    : loader_(loader)
    , policy_(policy)
{}

void Binder::attach(Command& cmd, Operation op) {
    auto& ops = bindings_[&cmd];
    ops.push_back(std::move(op));
    if (ops.size() > 1) {
        return;
    }

    Command* node = &cmd;
    cmd.set_resolver([this, node](Command& target) { resolve_node(*node, target); });
}

void Binder::resolve(Command& target) {
    for (Command* node : target.path_from_root()) {
        resolve_node(*node, target);
    }
}

void Binder::resolve_node(Command& node, Command& target) {
    const Command* root = &target.root();
    const std::uint64_t serial = target.dispatch_serial();
    if (root != last_root_ || serial != last_serial_) {
        visited_.clear();
        last_root_ = root;
        last_serial_ = serial;
    }

    auto it = bindings_.find(&node);
    if (it == bindings_.end() || visited_.count(&node) > 0) {
        return;
    }
    visited_.insert(&node);
    for (const auto& op : it->second) {
        op(target);
    }
}

std::string Binder::resolve_selector(Command& target, const std::string& selector_key) const {
    const std::string flag_name = to_kebab_case(selector_key);
    const Flag* flag = nullptr;
    for (Command* node = &target; node != nullptr && flag == nullptr; node = node->parent()) {
        flag = node->persistent_flags().lookup(flag_name);
    }

    if (flag != nullptr && flag->changed) {
        return render_flag_value(flag->target);
    }
    const Value stored = store().get(selector_key);
    if (!stored.is_null() && !is_container(stored)) {
        return to_text(stored);
    }
    if (flag != nullptr) {
        return render_flag_value(flag->target);
    }
    return "";
}

bool Binder::is_bound(const Command& cmd) const {
    return bindings_.count(&cmd) > 0;
}

void Binder::refresh_defaults(Command& cmd, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        cmd.persistent_flags().refresh_default(name);
    }
}

Binder& global_binder() {
    static Binder binder(global_loader());
    return binder;
}

} // namespace cfgbind
