#pragma once

#include "utils.hpp"

#include <array>
#include <cstdint>
#include <format>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace asmcmp {

    using namespace std::string_view_literals;

    /*
     * Supported extraction targets
     *
     * Every alias maps onto exactly one target triple that must already be installed for the
     * toolchain (`rustup target add <triple>`). Adding a target means adding an enumerator, its
     * triple, its display name and its accepted spellings below; the switches are exhaustive so
     * the compiler flags any mapping that was missed.
     *
     * - arm64:  aarch64-unknown-linux-musl  (accepts arm64, arm, aarch64)
     * - x86_64: x86_64-unknown-linux-musl   (accepts x86-64, x86_64, x86, amd64)
     */
    enum class target_alias : uint8_t { arm64, x86_64 };

    inline constexpr std::array all_target_aliases{target_alias::arm64, target_alias::x86_64};

    inline constexpr std::string_view to_string(target_alias alias) {
        switch (alias) {
            case target_alias::arm64:
                return "arm64"sv;
            case target_alias::x86_64:
                return "x86-64"sv;
        }
        return "arm64"sv;
    }

    inline constexpr std::string_view to_triple(target_alias alias) {
        switch (alias) {
            case target_alias::arm64:
                return "aarch64-unknown-linux-musl"sv;
            case target_alias::x86_64:
                return "x86_64-unknown-linux-musl"sv;
        }
        return "aarch64-unknown-linux-musl"sv;
    }

    inline constexpr bool try_parse_target_alias(std::string_view text, target_alias& out) {
        if (utils::str_case_eq(text, "arm64"sv) || utils::str_case_eq(text, "arm"sv) ||
            utils::str_case_eq(text, "aarch64"sv)) {
            out = target_alias::arm64;
            return true;
        }
        if (utils::str_case_eq(text, "x86-64"sv) || utils::str_case_eq(text, "x86_64"sv) ||
            utils::str_case_eq(text, "x86"sv) || utils::str_case_eq(text, "amd64"sv)) {
            out = target_alias::x86_64;
            return true;
        }
        return false;
    }

    // "arm64|x86-64"
    std::string accepted_aliases();

    class unknown_alias_error : public std::runtime_error {
      public:
        explicit unknown_alias_error(std::string alias);

        const std::string& alias() const noexcept { return alias_; }

      private:
        std::string alias_;
    };

    struct extraction_request {
        std::string function{};
        target_alias target{target_alias::arm64};

        std::string_view triple() const { return to_triple(target); }
    };

    // Throws unknown_alias_error for an alias outside the enumeration and std::invalid_argument
    // for an empty function identifier.
    extraction_request resolve_request(std::string_view alias, std::string function);

    // Resolves every alias before returning so that a typo late in the list is reported
    // before any extraction starts. Input order and duplicates are preserved.
    std::vector<target_alias> resolve_targets(std::span<const std::string> aliases);

}  // namespace asmcmp

namespace std {
    template <>
    struct formatter<asmcmp::target_alias, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(const asmcmp::target_alias& val, FormatContext& ctx) const {
            return formatter<std::string_view>::format(asmcmp::to_string(val), ctx);
        }
    };
}  // namespace std
