/**
 * @file Binder.hpp
 * @brief Bind records to command nodes and resolve them before dispatch
 *
 * Usage:
 * ```cpp
 * cfgbind::Binder binder(cfgbind::global_loader());
 * binder.bind(root, &root_config);              // whole store
 * binder.bind_key("nested", child2, &nested);   // sub-tree "nested"
 * root.run(argc, argv);
 * ```
 *
 * Binding registers a flag per primitive field and attaches a resolve
 * operation to the node. Before the dispatched node runs (or shows help),
 * every bound node from the root down to it resolves once, in root->leaf
 * order: load the store, decode the store value onto the record, restore
 * explicit flag values, refresh flag defaults.
 *
 * The binder must outlive every dispatch of the commands it is bound to.
 */

#ifndef CFGBIND_BINDER_HPP
#define CFGBIND_BINDER_HPP

#include "cfgbind/Command.hpp"
#include "cfgbind/ConfigLoader.hpp"
#include "cfgbind/Log.hpp"
#include "cfgbind/Record.hpp"
#include "cfgbind/Resolve.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cfgbind {

/**
 * @brief Which collection element a record binds to
 *
 * The element of `collection_key` whose `identifying_key` equals the
 * resolved value of `selector_key`.
 */
struct CollectionSelector {
    std::string collection_key;
    std::string selector_key;
    std::string identifying_key = "name";
    std::optional<Value> items;  ///< Used instead of the store's collection when set
};

/**
 * @brief Register one flag per Boolean/String/Integer/Float field
 *
 * Each flag writes into its field and shows the field's current value as
 * default. Record and Unsupported fields get no flag.
 *
 * @return Names of the registered flags
 */
template <typename T>
std::vector<std::string> register_flags(FlagSet& flags, T& record) {
    std::vector<std::string> names;
    for (const auto& field : describe<T>().fields()) {
        FlagTarget target = field.target(record);
        if (std::holds_alternative<std::monostate>(target)) continue;
        flags.add(field.flag_name, target, field.usage);
        names.push_back(field.flag_name);
    }
    return names;
}

/**
 * @brief First object in `items` whose `identifying_key` equals `wanted`
 *
 * Identifiers compare as text (non-string identifiers by their JSON text).
 * An empty `wanted` matches nothing.
 *
 * @return Pointer into `items`, or nullptr
 */
const Value* select_element(const Value& items, const std::string& identifying_key,
                            const std::string& wanted);

class Binder {
public:
    /**
     * @brief Resolve step for one bound node, called with the dispatched command
     */
    using Operation = std::function<void(Command& target)>;

    explicit Binder(ConfigLoader& loader, Precedence policy = Precedence::ExplicitFlags);

    Binder(const Binder&) = delete;
    Binder& operator=(const Binder&) = delete;

    /**
     * @brief Bind a record to the whole store
     * @throws InvalidTargetKind on a null record
     */
    template <typename T>
    void bind(Command& cmd, T* record) {
        bind_key("", cmd, record);
    }

    /**
     * @brief Bind a record to the sub-tree at `key`
     * @throws InvalidTargetKind on a null record
     */
    template <typename T>
    void bind_key(const std::string& key, Command& cmd, T* record);

    /**
     * @brief Bind a record to one element of a collection
     *
     * No matching element leaves the record as flag parsing left it.
     *
     * @throws InvalidTargetKind on a null record
     */
    template <typename T>
    void bind_collection_item(Command& cmd, T* record, CollectionSelector selector);

    /**
     * @brief Bind a sequence to every element of the array at `key`
     *
     * Registers no flags.
     *
     * @throws InvalidTargetKind on a null sequence
     */
    template <typename T>
    void bind_collection(const std::string& key, Command& cmd, std::vector<T>* records);

    /**
     * @brief Attach a resolve operation to a node
     *
     * The first attach on a node installs its resolver, which the dispatch
     * calls before any pre-run hook, help function or run action; later
     * attaches append to the same node. The node's own hooks are left
     * alone and may be set before or after binding.
     */
    void attach(Command& cmd, Operation op);

    /**
     * @brief Run the operations of every bound node from the root to `target`
     *
     * Each node runs at most once per dispatch of its tree.
     */
    void resolve(Command& target);

    /**
     * @brief Current value of a selector field
     *
     * An explicitly set flag of that name on the path to the root wins,
     * then the store value, then the flag's current value.
     */
    std::string resolve_selector(Command& target, const std::string& selector_key) const;

    bool is_bound(const Command& cmd) const;

    Store& store() const { return loader_.store(); }
    ConfigLoader& loader() const { return loader_; }
    Precedence policy() const noexcept { return policy_; }

private:
    template <typename T>
    Value source_for(const std::string& key) const;

    template <typename T>
    static FieldSet explicit_fields(const Command& cmd, T& record);

    void resolve_node(Command& node, Command& target);

    static void refresh_defaults(Command& cmd, const std::vector<std::string>& names);

    ConfigLoader& loader_;
    Precedence policy_;
    std::map<const Command*, std::vector<Operation>> bindings_;
    std::set<const Command*> visited_;
    const Command* last_root_ = nullptr;
    std::uint64_t last_serial_ = 0;
};

/**
 * @brief Process-wide binder over global_loader()
 */
Binder& global_binder();

// ============================================================================
// Template implementation
// ============================================================================

template <typename T>
FieldSet Binder::explicit_fields(const Command& cmd, T& record) {
    FieldSet names;
    for (const auto& field : describe<T>().fields()) {
        const Flag* flag = cmd.persistent_flags().lookup(field.flag_name);
        if (flag != nullptr && flag->changed && flag->target == field.target(record)) {
            names.insert(field.name);
        }
    }
    return names;
}

template <typename T>
Value Binder::source_for(const std::string& key) const {
    Value source = key.empty() ? store().all_settings() : store().get(key);
    if (source.is_null()) {
        source = Value::object();
    }
    if (!source.is_object()) {
        throw DecodeError(key, "object", type_name(source));
    }

    if (store().automatic_env_enabled()) {
        for (const auto& field : describe<T>().fields()) {
            if (field.kind == FieldKind::Record || field.kind == FieldKind::Unsupported) continue;
            const std::string name = to_lower(field.name);
            Value env = store().env_value(key.empty() ? name : to_lower(key) + "." + name);
            if (!env.is_null()) {
                source[name] = std::move(env);
            }
        }
    }
    return source;
}

template <typename T>
void Binder::bind_key(const std::string& key, Command& cmd, T* record) {
    if (record == nullptr) {
        throw InvalidTargetKind("null record bound to '" + cmd.command_path() + "'");
    }
    const auto names = register_flags(cmd.persistent_flags(), *record);
    Command* node = &cmd;

    attach(cmd, [this, key, node, record, names](Command&) {
        loader_.ensure_loaded();
        const Value source = source_for<T>(key);
        apply_precedence(*record, source, explicit_fields(*node, *record), policy_);
        refresh_defaults(*node, names);
        logger()->debug("Resolved '{}' from key '{}'", node->command_path(), key);
    });
}

template <typename T>
void Binder::bind_collection_item(Command& cmd, T* record, CollectionSelector selector) {
    if (record == nullptr) {
        throw InvalidTargetKind("null record bound to '" + cmd.command_path() + "'");
    }
    const auto names = register_flags(cmd.persistent_flags(), *record);
    Command* node = &cmd;

    attach(cmd, [this, node, record, names, selector = std::move(selector)](Command& target) {
        loader_.ensure_loaded();
        const std::string wanted = resolve_selector(target, selector.selector_key);
        const Value items = selector.items ? *selector.items : store().get(selector.collection_key);

        const Value* element = select_element(items, selector.identifying_key, wanted);
        if (element == nullptr) {
            logger()->debug("No element of '{}' with {} = '{}'", selector.collection_key,
                            selector.identifying_key, wanted);
            return;
        }
        apply_precedence(*record, *element, explicit_fields(*node, *record), policy_);
        refresh_defaults(*node, names);
    });
}

template <typename T>
void Binder::bind_collection(const std::string& key, Command& cmd, std::vector<T>* records) {
    if (records == nullptr) {
        throw InvalidTargetKind("null sequence bound to '" + cmd.command_path() + "'");
    }

    attach(cmd, [this, key, records](Command&) {
        loader_.ensure_loaded();
        const Value items = store().get(key);
        if (items.is_null()) {
            return;
        }
        if (!items.is_array()) {
            throw DecodeError(key, "array", type_name(items));
        }

        std::vector<T> decoded;
        decoded.reserve(items.size());
        for (std::size_t i = 0; i < items.size(); ++i) {
            T item{};
            decode(items[i], item, key + "[" + std::to_string(i) + "]");
            decoded.push_back(std::move(item));
        }
        *records = std::move(decoded);
    });
}

} // namespace cfgbind

#endif // CFGBIND_BINDER_HPP
