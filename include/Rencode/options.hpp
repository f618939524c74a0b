#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>

#include "annotated.hpp"
#include "const_string.hpp"
#include "struct_introspection.hpp"

namespace Rencode {

namespace options {

namespace detail {

struct exclude_tag{};
struct key_tag{};
struct allow_excess_fields_tag{};
struct as_array_tag {};
struct skip_nulls_tag {};

}

// Field is neither written nor read
struct exclude {
    using tag = detail::exclude_tag;
    static constexpr std::string_view to_string() {
        return "exclude";
    }
};

// Dictionary key used instead of the member name
template<ConstString Desc>
struct key {
    static_assert(Desc.check(), "[[[ Rencode ]]] key contains control characters");
    using tag = detail::key_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "key";
    }
};

// Record is encoded as a list of its field values, in declaration order
struct as_array {
    using tag = detail::as_array_tag;
    static constexpr std::string_view to_string() {
        return "as_array";
    }
};

// Null-valued fields are left out of the encoded dictionary
struct skip_nulls {
    using tag = detail::skip_nulls_tag;
    static constexpr std::string_view to_string() {
        return "skip_nulls";
    }
};

// Unknown dictionary keys are skipped, nested up to MaxSkipDepth levels
template<std::size_t MaxSkipDepth=64>
struct allow_excess_fields{
    static constexpr std::size_t SkipDepthLimit = MaxSkipDepth;
    using tag = detail::allow_excess_fields_tag;
    static constexpr std::string_view to_string() {
        return "allow_excess_fields";
    }
};

namespace detail {

template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};

template<class Tag, class... Opts>
struct find_option_by_tag;

template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        typename find_option_by_tag<Tag, Rest...>::type
        >;
};

struct no_options {
    template<class Tag>
    static constexpr bool has_option = false;

    template<class Tag>
    using get_option = void;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {

    template<class Tag>
    using option_type = typename detail::find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<option_type<Tag>>;

    template<class Tag>
    using get_option = option_type<Tag>;
};

template<class Field>
struct annotation_meta {
    using value_t  = Field;
    using options  = no_options;
    using OptionsP = OptionsPack<>;
    static constexpr decltype(auto) getRef(Field & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const Field & f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<std::optional<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ Rencode ]]] Use Annotated<std::optional<T>, ...> instead of std::optional<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<std::unique_ptr<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ Rencode ]]] Use Annotated<std::unique_ptr<T>, ...> instead of std::unique_ptr<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using value_t  = T;
    using OptionsP = OptionsPack<Opts...>;
    using options  = field_options<OptionsP>;

    static constexpr decltype(auto) getRef(Annotated<T, Opts...> & f) {
        return (f.value);
    }
    static constexpr decltype(auto) getRef(const Annotated<T, Opts...> & f) {
        return (f.value);
    }
};

template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};

template<class AggregateT, std::size_t Index>
using aggregate_field_opts_getter = typename annotation_meta_getter<
    introspection::structureElementTypeByIndex<Index, std::remove_cvref_t<AggregateT>>
    >::options;

} // namespace detail

} // namespace options

} // namespace Rencode
