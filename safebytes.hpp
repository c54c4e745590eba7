#pragma once
/*
  safebytes.hpp - single-header, padding-aware byte views of in-memory values.

  Goal: Read the object representation of a struct as bytes even when its layout
  contains padding. Padding bytes hold indeterminate values, so before a byte view
  is handed out every padding byte (including padding nested inside members,
  array elements and wrappers) is overwritten with a fixed sentinel. Field bytes
  are never touched.

  Types opt in by specializing sb::layout<T>. Scalars, arrays, std::array,
  std::pair, std::complex and std::atomic of scalars are registered here;
  aggregates use sb::members<T, &T::a, ...> or SB_FIELDS(T, a, ...).

  C++20 required (std::span, defaulted comparisons).
  Member lists of aggregates are checked against aggr_refl's member count.

  SPDX-License-Identifier: MIT
*/
#if __cplusplus < 202002L
#  error "safebytes requires C++20"
#endif
#ifndef SAFEBYTES_HPP_INCLUDED
#define SAFEBYTES_HPP_INCLUDED

#include <algorithm>
#include <array>
#include <atomic>
#include <bit>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <span>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <aggr_refl/aggregate_reflection.hpp>

#if defined(_MSC_VER)
  #define SB_FORCEINLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
  #define SB_FORCEINLINE __attribute__((always_inline)) inline
#else
  #define SB_FORCEINLINE inline
#endif

#ifndef SB_ASSERT
  #include <cassert>
  #define SB_ASSERT(x) assert(x)
#endif

#ifndef SB_PADDING_SENTINEL
  #define SB_PADDING_SENTINEL 0xFE
#endif

namespace sb {

  // Written into every padding byte. Any fixed value satisfies the contract;
  // 0xFE is easy to spot in a hex dump.
  inline constexpr std::byte padding_sentinel{static_cast<unsigned char>(SB_PADDING_SENTINEL)};


  // field descriptors


  // Where one field lives inside its parent's byte image.
  struct field {
    std::size_t offset{};
    std::size_t size{};

    constexpr std::size_t end() const noexcept { return offset + size; }
    friend constexpr bool operator==(field const&, field const&) noexcept = default;
  };

  // Metadata of a type with no fields of its own.
  struct no_fields {};


  // layout customization point

  //
  // A specialization provides:
  //
  //   using fields_type = ...;   // copyable, identical for every instance of T
  //   static fields_type get_fields(T const& value);
  //   static void init_padding(fields_type const& fields, std::span<std::byte> bytes);
  //
  // init_padding preconditions (not checked beyond SB_ASSERT):
  //   - fields came from get_fields on some instance of T;
  //   - bytes.size() == sizeof(T) and bytes is, or aliases, the storage of a T
  //     (for a member, the sub-range of the parent's storage holding it).
  // It writes padding_sentinel into every padding byte and nothing else.
  //
  template <typename T, typename Enable = void>
  struct layout {};

  namespace detail {

    template <typename T>
    using layout_of = layout<std::remove_cv_t<T>>;

    template <typename T, typename = void>
    struct is_layout_aware : std::false_type {};

    template <typename T>
    struct is_layout_aware<T, std::void_t<
      typename layout_of<T>::fields_type,
      decltype(layout_of<T>::get_fields(std::declval<T const&>())),
      decltype(layout_of<T>::init_padding(std::declval<typename layout_of<T>::fields_type const&>(),
                                          std::declval<std::span<std::byte>>()))
    >> : std::bool_constant<
      std::is_copy_constructible_v<typename layout_of<T>::fields_type> &&
      std::is_same_v<decltype(layout_of<T>::get_fields(std::declval<T const&>())),
                     typename layout_of<T>::fields_type>
    > {};

    template <typename T>
    struct is_span : std::false_type {};
    template <typename T, std::size_t E>
    struct is_span<std::span<T, E>> : std::true_type {};
    template <typename T>
    inline constexpr bool is_span_v = is_span<std::remove_cv_t<T>>::value;

    template <typename T>
    struct is_std_array : std::false_type {};
    template <typename T, std::size_t N>
    struct is_std_array<std::array<T, N>> : std::true_type {};

    template <typename T>
    struct member_pointer_traits;

    template <typename C, typename M>
    struct member_pointer_traits<M C::*> {
      using class_type = C;
      using member_type = M;
    };

    template <auto MemberPtr>
    using member_t = std::remove_cv_t<
      typename member_pointer_traits<std::remove_cv_t<decltype(MemberPtr)>>::member_type>;

    template <auto MemberPtr>
    using member_class_t =
      typename member_pointer_traits<std::remove_cv_t<decltype(MemberPtr)>>::class_type;

    template <typename T, auto MemberPtr>
    inline constexpr bool is_data_member_of_v =
      std::is_member_object_pointer_v<decltype(MemberPtr)> &&
      std::is_base_of_v<typename member_pointer_traits<std::remove_cv_t<decltype(MemberPtr)>>::class_type, T>;

    // Distance in bytes from the start of `parent` to the start of `member`.
    template <typename P, typename M>
    SB_FORCEINLINE std::size_t address_delta(P const& parent, M const& member) noexcept {
      auto const base = reinterpret_cast<std::uintptr_t>(std::addressof(parent));
      auto const addr = reinterpret_cast<std::uintptr_t>(std::addressof(member));
      SB_ASSERT(addr >= base);
      return static_cast<std::size_t>(addr - base);
    }

    // plain scalars: every byte of the representation is value
    template <typename T>
    inline constexpr bool is_plain_scalar_v =
      (std::is_arithmetic_v<T> && !std::is_same_v<T, long double>) ||
      std::is_enum_v<T> ||
      std::is_pointer_v<T>;

    // Bytes a member of type M owns inside its parent. An empty member has no
    // value bytes and, with [[no_unique_address]], may share its storage with
    // the next field.
    template <typename M>
    inline constexpr std::size_t occupied_size_v = std::is_empty_v<M> ? 0 : sizeof(M);

    // For an aggregate whose listed members are all its own, the list must
    // name every one of them: an unlisted member would be taken for padding.
    template <typename T, auto... MemberPtrs>
    constexpr bool lists_every_member() noexcept {
      if constexpr (std::is_aggregate_v<T> && !std::is_union_v<T> &&
                    (std::is_same_v<member_class_t<MemberPtrs>, T> && ...)) {
        return aggr_refl::tuple_size_v<T> == sizeof...(MemberPtrs);
      } else {
        return true;
      }
    }

    // x87 extended precision keeps 10 value bytes in 12 or 16 bytes of storage.
    inline constexpr std::size_t long_double_value_bytes =
      (std::numeric_limits<long double>::digits == 64 &&
       std::endian::native == std::endian::little &&
       sizeof(long double) > 10) ? 10 : sizeof(long double);

  } // namespace detail

  template <typename T>
  inline constexpr bool is_layout_aware_v = detail::is_layout_aware<T>::value;

  template <typename T>
  using fields_t = typename detail::layout_of<T>::fields_type;


  // typed field descriptor


  // A field descriptor plus the metadata of the field's own type, so the
  // algorithm can recurse into it.
  template <typename F>
  struct typed_field {
    field raw;
    fields_t<F> sub;
  };

  // Describes `member`, a data member of `parent`, by address delta and sizeof.
  // `member` must be a reference into `parent` (e.g. parent.x). Members of
  // empty type get size 0.
  template <typename P, typename M>
  SB_FORCEINLINE typed_field<M> make_typed_field(P const& parent, M const& member) noexcept {
    static_assert(is_layout_aware_v<M>, "make_typed_field: member type has no sb::layout specialization");
    return typed_field<M>{
      field{detail::address_delta(parent, member), detail::occupied_size_v<M>},
      detail::layout_of<M>::get_fields(member)
    };
  }


  // generic algorithm


  // Sorts `fields` by offset and writes padding_sentinel into every byte of
  // `bytes` no field covers: gaps between fields and the tail after the last.
  // Fields of non-zero size must not overlap. An overlap is flagged through
  // SB_ASSERT; gap filling still never writes inside any field.
  inline void fill_gaps(std::span<field> fields, std::span<std::byte> bytes) noexcept {
    std::sort(fields.begin(), fields.end(),
              [](field const& a, field const& b) noexcept { return a.offset < b.offset; });

    std::size_t cursor = 0;
    for (field const& f : fields) {
      SB_ASSERT(f.end() <= bytes.size());
      SB_ASSERT(f.size == 0 || f.offset >= cursor);
      if (f.offset > cursor) {
        std::fill(bytes.begin() + cursor, bytes.begin() + f.offset, padding_sentinel);
      }
      cursor = std::max(cursor, f.end());
    }

    // tail
    if (cursor < bytes.size()) {
      std::fill(bytes.begin() + cursor, bytes.end(), padding_sentinel);
    }
  }

  // Recurses into one field: fills the padding inside the field's own bytes.
  // `bytes` is the parent's byte image. A zero-sized field owns no bytes.
  template <typename F>
  SB_FORCEINLINE void init_field_padding(typed_field<F> const& f, std::span<std::byte> bytes) noexcept {
    SB_ASSERT(f.raw.end() <= bytes.size());
    if (f.raw.size == 0) {
      return;
    }
    detail::layout_of<F>::init_padding(f.sub, bytes.subspan(f.raw.offset, f.raw.size));
  }

  template <typename T>
  SB_FORCEINLINE fields_t<T> get_fields(T const& value) noexcept {
    static_assert(is_layout_aware_v<T>, "get_fields: T has no sb::layout specialization");
    return detail::layout_of<T>::get_fields(value);
  }

  template <typename T>
  SB_FORCEINLINE void init_padding(fields_t<T> const& fields, std::span<std::byte> bytes) noexcept {
    static_assert(is_layout_aware_v<T>, "init_padding: T has no sb::layout specialization");
    detail::layout_of<T>::init_padding(fields, bytes);
  }

  namespace detail {
    // Homogeneous sequence: no gaps between elements, all padding is interior.
    template <typename E>
    SB_FORCEINLINE void init_elements(fields_t<E> const& fields, std::span<std::byte> bytes,
                                      std::size_t count) noexcept {
      for (std::size_t i = 0; i < count; ++i) {
        layout_of<E>::init_padding(fields, bytes.subspan(i * sizeof(E), sizeof(E)));
      }
    }
  } // namespace detail


  // base cases


  // Types whose whole representation is value.
  template <typename T>
  struct scalar_layout {
    using fields_type = no_fields;

    SB_FORCEINLINE static fields_type get_fields(T const&) noexcept { return {}; }

    SB_FORCEINLINE static void init_padding(fields_type const&, std::span<std::byte> bytes) noexcept {
      SB_ASSERT(bytes.size() == sizeof(T));
      (void)bytes;
    }
  };

  // Types with no value bytes at all (empty classes, std::array<T, 0>).
  // They still occupy storage, and all of it is padding.
  template <typename T>
  struct marker_layout {
    using fields_type = no_fields;

    SB_FORCEINLINE static fields_type get_fields(T const&) noexcept { return {}; }

    SB_FORCEINLINE static void init_padding(fields_type const&, std::span<std::byte> bytes) noexcept {
      SB_ASSERT(bytes.size() == sizeof(T));
      std::fill(bytes.begin(), bytes.end(), padding_sentinel);
    }
  };

  template <typename T>
  struct layout<T, std::enable_if_t<detail::is_plain_scalar_v<T>>> : scalar_layout<T> {};

  template <>
  struct layout<long double> {
    using fields_type = no_fields;

    SB_FORCEINLINE static fields_type get_fields(long double const&) noexcept { return {}; }

    SB_FORCEINLINE static void init_padding(fields_type const&, std::span<std::byte> bytes) noexcept {
      SB_ASSERT(bytes.size() == sizeof(long double));
      if constexpr (detail::long_double_value_bytes < sizeof(long double)) {
        std::fill(bytes.begin() + detail::long_double_value_bytes, bytes.end(), padding_sentinel);
      }
    }
  };

  template <typename T>
  struct layout<T, std::enable_if_t<std::is_empty_v<T> && !detail::is_std_array<T>::value>>
    : marker_layout<T> {};

  template <typename T>
  struct layout<std::atomic<T>, std::enable_if_t<
    detail::is_plain_scalar_v<T> && sizeof(std::atomic<T>) == sizeof(T)
  >> : scalar_layout<std::atomic<T>> {};


  // fixed-size sequences


  template <typename T, std::size_t N>
  struct layout<T[N], std::enable_if_t<is_layout_aware_v<T>>> {
    using fields_type = fields_t<T>;

    // all elements share T's layout; the first one speaks for the rest
    SB_FORCEINLINE static fields_type get_fields(T const (&value)[N]) noexcept {
      return detail::layout_of<T>::get_fields(value[0]);
    }

    SB_FORCEINLINE static void init_padding(fields_type const& fields, std::span<std::byte> bytes) noexcept {
      SB_ASSERT(bytes.size() == sizeof(T[N]));
      detail::init_elements<T>(fields, bytes, N);
    }
  };

  template <typename T, std::size_t N>
  struct layout<std::array<T, N>, std::enable_if_t<(N > 0) && is_layout_aware_v<T>>> {
    static_assert(sizeof(std::array<T, N>) == N * sizeof(T), "std::array with extra storage is not supported");

    using fields_type = fields_t<T>;

    SB_FORCEINLINE static fields_type get_fields(std::array<T, N> const& value) noexcept {
      return detail::layout_of<T>::get_fields(value[0]);
    }

    SB_FORCEINLINE static void init_padding(fields_type const& fields, std::span<std::byte> bytes) noexcept {
      SB_ASSERT(bytes.size() == sizeof(std::array<T, N>));
      detail::init_elements<T>(fields, bytes, N);
    }
  };

  template <typename T>
  struct layout<std::array<T, 0>> : marker_layout<std::array<T, 0>> {};

  // std::complex<T> is array-compatible with T[2]
  template <typename T>
  struct layout<std::complex<T>, std::enable_if_t<is_layout_aware_v<T>>> {
    static_assert(sizeof(std::complex<T>) == 2 * sizeof(T));

    using fields_type = fields_t<T>;

    SB_FORCEINLINE static fields_type get_fields(std::complex<T> const& value) noexcept {
      return detail::layout_of<T>::get_fields(reinterpret_cast<T const(&)[2]>(value)[0]);
    }

    SB_FORCEINLINE static void init_padding(fields_type const& fields, std::span<std::byte> bytes) noexcept {
      SB_ASSERT(bytes.size() == sizeof(std::complex<T>));
      detail::init_elements<T>(fields, bytes, 2);
    }
  };


  // transparent wrappers

  // For a wrapper whose only member is the wrapped value:
  //
  //   struct meters { double value; };
  //   template <> struct sb::layout<meters> : sb::transparent_layout<meters, &meters::value> {};
  //
  template <typename W, auto MemberPtr>
  struct transparent_layout {
    using inner_type = detail::member_t<MemberPtr>;

    static_assert(detail::is_data_member_of_v<W, MemberPtr>, "transparent_layout: member pointer must be a data member of W");
    static_assert(std::is_standard_layout_v<W>, "transparent_layout: W must be standard-layout");
    static_assert(sizeof(W) == sizeof(inner_type), "transparent_layout: W must have the size of its inner value");
    static_assert(is_layout_aware_v<inner_type>, "transparent_layout: inner type has no sb::layout specialization");

    using fields_type = fields_t<inner_type>;

    SB_FORCEINLINE static fields_type get_fields(W const& value) noexcept {
      SB_ASSERT(detail::address_delta(value, value.*MemberPtr) == 0);
      return detail::layout_of<inner_type>::get_fields(value.*MemberPtr);
    }

    SB_FORCEINLINE static void init_padding(fields_type const& fields, std::span<std::byte> bytes) noexcept {
      detail::layout_of<inner_type>::init_padding(fields, bytes);
    }
  };


  // composites: members<T, &T::a, &T::b, ...>

  // Complete layout for a class from its data member list. Declaration order
  // does not need to match memory order.
  //
  //   struct msg { std::uint8_t a; std::uint64_t b; std::uint16_t c; };
  //   template <> struct sb::layout<msg> : sb::members<msg, &msg::a, &msg::b, &msg::c> {};
  //
  // Every data member must be listed: an unlisted member is taken for padding
  // and overwritten. For aggregates this is checked against the reflected
  // member count. Members of T's bases may be listed too (unchecked).
  //
  // Members may not overlap. Empty members under [[no_unique_address]] are
  // fine; a member whose tail padding holds a later field is rejected when the
  // member sizes add up past sizeof(T), and flagged by SB_ASSERT otherwise.
  //
  template <typename T, auto... MemberPtrs>
  struct members {
    static_assert(!std::is_union_v<T>, "members: unions have no single field layout");
    static_assert(std::is_class_v<T>, "members: T must be a class type");
    static_assert(std::is_standard_layout_v<T>, "members: T must be standard-layout");
    static_assert((detail::is_data_member_of_v<T, MemberPtrs> && ...), "members: every member pointer must be a data member of T");
    static_assert((is_layout_aware_v<detail::member_t<MemberPtrs>> && ...), "members: member type has no sb::layout specialization");
    static_assert(detail::lists_every_member<T, MemberPtrs...>(), "members: every data member of T must be listed");
    static_assert((0 + ... + detail::occupied_size_v<detail::member_t<MemberPtrs>>) <= sizeof(T),
                  "members: members overlap (tail padding reused under [[no_unique_address]])");

    static constexpr std::size_t field_count = sizeof...(MemberPtrs);

    using fields_type = std::tuple<typed_field<detail::member_t<MemberPtrs>>...>;

    static fields_type get_fields(T const& value) noexcept {
      return fields_type{make_typed_field(value, value.*MemberPtrs)...};
    }

    static void init_padding(fields_type const& fields, std::span<std::byte> bytes) noexcept {
      SB_ASSERT(bytes.size() == sizeof(T));
      std::apply([bytes](auto const&... f) noexcept {
        std::array<field, field_count> raw{f.raw...};
        fill_gaps(raw, bytes);
        (init_field_padding(f, bytes), ...);
      }, fields);
    }
  };

  template <typename A, typename B>
  struct layout<std::pair<A, B>, std::enable_if_t<is_layout_aware_v<A> && is_layout_aware_v<B>>>
    : members<std::pair<A, B>, &std::pair<A, B>::first, &std::pair<A, B>::second> {};


  // byte views


  // Fills the padding of `value` and returns its object representation.
  // The view aliases `value`: it is valid while `value` lives and is not
  // modified. Needs exclusive access for the duration of the call.
  template <typename T, typename = std::enable_if_t<!detail::is_span_v<T>>>
  SB_FORCEINLINE std::span<std::byte const, sizeof(T)> safe_bytes(T& value) noexcept {
    static_assert(!std::is_const_v<T>, "safe_bytes: padding is written in place, value must be mutable");
    static_assert(is_layout_aware_v<T>, "safe_bytes: T has no sb::layout specialization");

    auto const fields = detail::layout_of<T>::get_fields(value);
    std::span<std::byte, sizeof(T)> bytes(reinterpret_cast<std::byte*>(std::addressof(value)), sizeof(T));
    detail::layout_of<T>::init_padding(fields, bytes);
    return bytes;
  }

  // Sequence form: one contiguous view over every element.
  template <typename T, std::size_t Extent>
  SB_FORCEINLINE std::span<std::byte const> safe_bytes(std::span<T, Extent> values) noexcept {
    static_assert(!std::is_const_v<T>, "safe_bytes: padding is written in place, elements must be mutable");
    static_assert(is_layout_aware_v<T>, "safe_bytes: T has no sb::layout specialization");

    if (values.empty()) {
      return {};
    }
    auto const fields = detail::layout_of<T>::get_fields(values[0]);
    std::span<std::byte> bytes = std::as_writable_bytes(values);
    detail::init_elements<T>(fields, bytes, values.size());
    return bytes;
  }

  // The view would dangle.
  template <typename T, typename = std::enable_if_t<!detail::is_span_v<T>>>
  void safe_bytes(T const&& value) = delete;


  // padding map

  // Lists padding without exposing any instance: init_padding runs over a
  // scratch buffer, and every byte it turned into the sentinel is padding.
  // Requires init_padding to only ever write the sentinel, as every layout
  // in this header does.

  template <typename T>
  std::vector<field> padding_map(T const& value) {
    static_assert(is_layout_aware_v<T>, "padding_map: T has no sb::layout specialization");

    constexpr std::byte blank = ~padding_sentinel;
    auto const fields = detail::layout_of<T>::get_fields(value);
    std::vector<std::byte> scratch(sizeof(T), blank);
    detail::layout_of<T>::init_padding(fields, std::span<std::byte>(scratch));

    std::vector<field> out;
    for (std::size_t i = 0; i < scratch.size(); ++i) {
      if (scratch[i] == blank) continue;
      if (!out.empty() && out.back().end() == i) {
        ++out.back().size;
      } else {
        out.push_back(field{i, 1});
      }
    }
    return out;
  }

  template <typename T>
  std::vector<field> padding_map() {
    static_assert(std::is_default_constructible_v<T>, "padding_map<T>(): T must be default constructible, pass an instance instead");
    T const value{};
    return padding_map(value);
  }

  template <typename T>
  std::size_t padding_size() {
    std::size_t n = 0;
    for (field const& f : padding_map<T>()) n += f.size;
    return n;
  }

  template <typename T>
  bool has_padding() {
    return padding_size<T>() != 0;
  }

} // namespace sb


// SB_FIELDS(Type, member...)

// Expands to the sb::layout<Type> specialization built from sb::members.
// Use at global namespace scope, after Type is complete. Type must be a plain
// name (no template arguments with commas); specialize sb::layout by hand for
// class templates. Up to 16 members.
//
//   struct msg { std::uint8_t a; std::uint64_t b; std::uint16_t c; };
//   SB_FIELDS(msg, a, b, c);
//
#define SB_FIELDS(Type, ...)                                                   \
  template <>                                                                  \
  struct sb::layout<Type> : ::sb::members<Type, SB_MEMBER_PTRS_(Type, __VA_ARGS__)> {}

#define SB_MEMBER_PTR_(Type, Member) &Type::Member

#define SB_MEMBER_PTRS_(Type, ...)                                             \
  SB_SELECT_(__VA_ARGS__, SB_MAP_16_, SB_MAP_15_, SB_MAP_14_, SB_MAP_13_,      \
             SB_MAP_12_, SB_MAP_11_, SB_MAP_10_, SB_MAP_9_, SB_MAP_8_,         \
             SB_MAP_7_, SB_MAP_6_, SB_MAP_5_, SB_MAP_4_, SB_MAP_3_,            \
             SB_MAP_2_, SB_MAP_1_)(SB_MEMBER_PTR_, Type, __VA_ARGS__)

#define SB_SELECT_(_1, _2, _3, _4, _5, _6, _7, _8, _9, _10, _11, _12, _13,     \
                   _14, _15, _16, N, ...)                                      \
  N

#define SB_MAP_1_(M, T, a) M(T, a)
#define SB_MAP_2_(M, T, a, ...) M(T, a), SB_MAP_1_(M, T, __VA_ARGS__)
#define SB_MAP_3_(M, T, a, ...) M(T, a), SB_MAP_2_(M, T, __VA_ARGS__)
#define SB_MAP_4_(M, T, a, ...) M(T, a), SB_MAP_3_(M, T, __VA_ARGS__)
#define SB_MAP_5_(M, T, a, ...) M(T, a), SB_MAP_4_(M, T, __VA_ARGS__)
#define SB_MAP_6_(M, T, a, ...) M(T, a), SB_MAP_5_(M, T, __VA_ARGS__)
#define SB_MAP_7_(M, T, a, ...) M(T, a), SB_MAP_6_(M, T, __VA_ARGS__)
#define SB_MAP_8_(M, T, a, ...) M(T, a), SB_MAP_7_(M, T, __VA_ARGS__)
#define SB_MAP_9_(M, T, a, ...) M(T, a), SB_MAP_8_(M, T, __VA_ARGS__)
#define SB_MAP_10_(M, T, a, ...) M(T, a), SB_MAP_9_(M, T, __VA_ARGS__)
#define SB_MAP_11_(M, T, a, ...) M(T, a), SB_MAP_10_(M, T, __VA_ARGS__)
#define SB_MAP_12_(M, T, a, ...) M(T, a), SB_MAP_11_(M, T, __VA_ARGS__)
#define SB_MAP_13_(M, T, a, ...) M(T, a), SB_MAP_12_(M, T, __VA_ARGS__)
#define SB_MAP_14_(M, T, a, ...) M(T, a), SB_MAP_13_(M, T, __VA_ARGS__)
#define SB_MAP_15_(M, T, a, ...) M(T, a), SB_MAP_14_(M, T, __VA_ARGS__)
#define SB_MAP_16_(M, T, a, ...) M(T, a), SB_MAP_15_(M, T, __VA_ARGS__)

#endif // SAFEBYTES_HPP_INCLUDED
