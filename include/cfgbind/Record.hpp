/**
 * @file Record.hpp
 * @brief Field introspection and Value codec for bindable records
 *
 * C++ has no runtime reflection, so a record type is described once by
 * specializing cfgbind::Describe:
 *
 * ```cpp
 * struct Server {
 *     std::string Host = "localhost";
 *     int Port = 8080;
 *     bool Verbose = false;
 * };
 *
 * namespace cfgbind {
 * template <>
 * struct Describe<Server> {
 *     static void fields(Schema<Server>& s) {
 *         s.field("Host", &Server::Host, "address to bind")
 *          .field("Port", &Server::Port, "port to listen on")
 *          .field("Verbose", &Server::Verbose);
 *     }
 * };
 * } // namespace cfgbind
 * ```
 *
 * describe<Server>() builds the field table on first use and caches it
 * for the life of the process. encode() and decode() convert between a
 * record and a Value object keyed by the declared field names.
 */

#ifndef CFGBIND_RECORD_HPP
#define CFGBIND_RECORD_HPP

#include "cfgbind/Errors.hpp"
#include "cfgbind/Naming.hpp"
#include "cfgbind/Value.hpp"

#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace cfgbind {

// ============================================================================
// Field kinds
// ============================================================================

/**
 * @brief Kind of a record field
 *
 * Only the four primitive kinds can be bound to flags. Record fields are
 * nested described records. Unsupported fields go through nlohmann::json
 * conversion when the type allows it and are otherwise ignored.
 */
enum class FieldKind {
    Boolean,
    String,
    Integer,
    Float,
    Record,
    Unsupported
};

/**
 * @brief Lower-case kind name ("bool", "string", "int", "float", ...)
 */
const char* kind_name(FieldKind kind);

/**
 * @brief Typed write target of a flag
 *
 * std::monostate means "no flag for this field".
 */
using FlagTarget = std::variant<std::monostate, bool*, std::string*, int*, double*>;

template <typename T>
class Schema;

/**
 * @brief Record description hook
 *
 * Specialize with `static void fields(Schema<T>&)`. The primary template
 * is intentionally empty so that undescribed types are detectable.
 */
template <typename T>
struct Describe {};

namespace detail {

template <typename T, typename = void>
struct has_describe : std::false_type {};

template <typename T>
struct has_describe<T, std::void_t<decltype(Describe<T>::fields(std::declval<Schema<T>&>()))>>
    : std::true_type {};

template <typename M>
inline constexpr bool is_flag_type_v =
    std::is_same_v<M, bool> || std::is_same_v<M, std::string> ||
    std::is_same_v<M, int> || std::is_same_v<M, double>;

} // namespace detail

/**
 * @brief True when T has a Describe<T> specialization
 */
template <typename T>
inline constexpr bool is_record_v = detail::has_describe<T>::value;

/**
 * @brief Field kind of a member type
 */
template <typename M>
constexpr FieldKind kind_of() {
    if constexpr (std::is_same_v<M, bool>) {
        return FieldKind::Boolean;
    } else if constexpr (std::is_same_v<M, std::string>) {
        return FieldKind::String;
    } else if constexpr (std::is_same_v<M, int>) {
        return FieldKind::Integer;
    } else if constexpr (std::is_same_v<M, double>) {
        return FieldKind::Float;
    } else if constexpr (is_record_v<M>) {
        return FieldKind::Record;
    } else {
        return FieldKind::Unsupported;
    }
}

// ============================================================================
// Scalar coercion
// ============================================================================

// Weakly typed: numbers, bools and numeric strings convert into each
// other. Anything else throws DecodeError naming `path`.

bool coerce_bool(const Value& v, const std::string& path);
int coerce_int(const Value& v, const std::string& path);
double coerce_float(const Value& v, const std::string& path);
std::string coerce_string(const Value& v, const std::string& path);

// ============================================================================
// Field descriptors
// ============================================================================

/**
 * @brief Read-only view of one record field
 */
struct FieldDescriptor {
    std::string name;       ///< Declared identifier, e.g. "FirstParam"
    std::string flag_name;  ///< Canonical external name, e.g. "first-param"
    FieldKind kind = FieldKind::Unsupported;
    std::string usage;
};

/**
 * @brief Field descriptor plus typed accessors for records of type T
 */
template <typename T>
struct Field : FieldDescriptor {
    std::function<FlagTarget(T&)> target;
    std::function<Value(const T&)> encode;
    std::function<void(T&, const Value&, const std::string&)> decode;
    std::function<void(T&, const T&)> copy;
};

/**
 * @brief Find the value for a field in a decoded object
 *
 * Matches the declared name case-insensitively, then the canonical flag
 * name.
 *
 * @return Pointer into `obj`, or nullptr
 */
const Value* find_field_value(const Value& obj, const FieldDescriptor& field);

/**
 * @brief Find a key in an object, ignoring case
 */
const Value* find_key_icase(const Value& obj, const std::string& key);

template <typename T>
const Schema<T>& describe();

template <typename T>
Value encode(const T& record);

template <typename T>
void decode(const Value& data, T& record, const std::string& path = "");

namespace detail {

inline std::string child_path(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "." + name;
}

template <typename M>
void decode_member(const Value& v, M& out, const std::string& path) {
    if constexpr (std::is_same_v<M, bool>) {
        out = coerce_bool(v, path);
    } else if constexpr (std::is_same_v<M, std::string>) {
        out = coerce_string(v, path);
    } else if constexpr (std::is_same_v<M, int>) {
        out = coerce_int(v, path);
    } else if constexpr (std::is_same_v<M, double>) {
        out = coerce_float(v, path);
    } else if constexpr (is_record_v<M>) {
        cfgbind::decode(v, out, path);
    } else if constexpr (std::is_constructible_v<Value, const M&>) {
        try {
            out = v.get<M>();
        } catch (const nlohmann::json::exception&) {
            throw DecodeError(path, "compatible value", type_name(v));
        }
    }
}

template <typename M>
Value encode_member(const M& member) {
    if constexpr (is_record_v<M>) {
        return cfgbind::encode(member);
    } else if constexpr (std::is_constructible_v<Value, const M&>) {
        return Value(member);
    } else {
        return Value();
    }
}

} // namespace detail

// ============================================================================
// Schema
// ============================================================================

/**
 * @brief Ordered field table of a record type
 *
 * Canonical flag names are unique within one schema; a duplicate raises
 * SchemaError while the schema is being built.
 */
template <typename T>
class Schema {
public:
    /**
     * @brief Add a field
     *
     * @param name Declared identifier; the flag name is derived from it
     * @param member Pointer to the data member
     * @param usage Help text for the flag
     */
    template <typename M>
    Schema& field(std::string name, M T::*member, std::string usage = "") {
        Field<T> f;
        f.name = std::move(name);
        f.flag_name = to_kebab_case(f.name);
        f.kind = kind_of<M>();
        f.usage = std::move(usage);

        for (const auto& existing : fields_) {
            if (existing.flag_name == f.flag_name) {
                throw SchemaError("Duplicate field name '" + f.flag_name + "' (from '" +
                                  f.name + "' and '" + existing.name + "')");
            }
        }

        f.target = [member](T& record) -> FlagTarget {
            if constexpr (detail::is_flag_type_v<M>) {
                return &(record.*member);
            } else {
                return std::monostate{};
            }
        };
        f.encode = [member](const T& record) { return detail::encode_member(record.*member); };
        f.decode = [member](T& record, const Value& v, const std::string& path) {
            detail::decode_member(v, record.*member, path);
        };
        f.copy = [member](T& dst, const T& src) { dst.*member = src.*member; };

        fields_.push_back(std::move(f));
        return *this;
    }

    const std::vector<Field<T>>& fields() const noexcept { return fields_; }

    std::size_t size() const noexcept { return fields_.size(); }

    /**
     * @brief Look up a field by declared name (case-insensitive) or flag name
     */
    const Field<T>* find(const std::string& name) const {
        for (const auto& f : fields_) {
            if (iequals(f.name, name) || f.flag_name == name) return &f;
        }
        return nullptr;
    }

    /**
     * @brief Plain descriptors, in declaration order
     */
    std::vector<FieldDescriptor> descriptors() const {
        return std::vector<FieldDescriptor>(fields_.begin(), fields_.end());
    }

private:
    std::vector<Field<T>> fields_;
};

/**
 * @brief Field table of record type T, built once and cached
 */
template <typename T>
const Schema<T>& describe() {
    static_assert(is_record_v<T>,
                  "cfgbind: bindable records need a cfgbind::Describe<T> specialization");
    static const Schema<T> schema = [] {
        Schema<T> s;
        Describe<T>::fields(s);
        return s;
    }();
    return schema;
}

// ============================================================================
// Codec
// ============================================================================

/**
 * @brief Encode a record as an object keyed by declared field names
 */
template <typename T>
Value encode(const T& record) {
    Value out = Value::object();
    for (const auto& field : describe<T>().fields()) {
        out[field.name] = field.encode(record);
    }
    return out;
}

/**
 * @brief Decode an object onto an existing record
 *
 * Fields missing from `data` (or null in it) keep their current value.
 * A null `data` leaves the record untouched.
 *
 * @param data Source object
 * @param record Target record (modified in place)
 * @param path Dotted prefix used in error messages
 * @throws DecodeError if `data` is not an object or a value cannot be
 *         coerced onto its field; fields decoded before the failure keep
 *         their new values
 */
template <typename T>
void decode(const Value& data, T& record, const std::string& path) {
    if (data.is_null()) {
        return;
    }
    if (!data.is_object()) {
        throw DecodeError(path.empty() ? "<root>" : path, "object", type_name(data));
    }
    for (const auto& field : describe<T>().fields()) {
        const Value* v = find_field_value(data, field);
        if (v == nullptr || v->is_null()) continue;
        field.decode(record, *v, detail::child_path(path, field.name));
    }
}

} // namespace cfgbind

#endif // CFGBIND_RECORD_HPP
