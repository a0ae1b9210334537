#ifndef JCX_DIVAN_FIXEDSTRING_H
#define JCX_DIVAN_FIXEDSTRING_H

#include <algorithm>
#include <cstddef>
#include <string_view>

namespace jcailloux::divan::config {

/// Structural string usable as a non-type template parameter:
///   Accessor<Account, "Account"> accounts{store};
template<size_t N>
struct FixedString {
    char value[N]{};

    constexpr FixedString(const char (&str)[N]) {
        std::copy_n(str, N, value);
    }

    constexpr operator const char*() const { return value; }

    [[nodiscard]] constexpr std::string_view view() const { return {value, N - 1}; }

    /// ASCII upper-case copy, computed at compile time for key prefixes.
    [[nodiscard]] constexpr FixedString upper() const {
        FixedString out = *this;
        for (size_t i = 0; i < N; ++i) {
            if (out.value[i] >= 'a' && out.value[i] <= 'z')
                out.value[i] = static_cast<char>(out.value[i] - 'a' + 'A');
        }
        return out;
    }

    constexpr auto operator<=>(const FixedString&) const = default;
};

}  // namespace jcailloux::divan::config

#endif //JCX_DIVAN_FIXEDSTRING_H
