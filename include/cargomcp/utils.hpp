#pragma once

#include <algorithm>
#include <iostream>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace cargomcp {

// Debug logger; no-op on release builds
#ifndef NDEBUG
    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    namespace utils {

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

        // true for tokens a command line parser would read as an option
        constexpr bool looks_like_flag(std::string_view token) {
            return !token.empty() && token.front() == '-';
        }

        constexpr bool is_toolchain_char(char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.' ||
                   c == '_' || c == '-';
        }

        constexpr bool is_valid_toolchain(std::string_view name) {
            return !name.empty() && !looks_like_flag(name) && std::ranges::all_of(name, is_toolchain_char);
        }

        // Quote a token for display only; never fed back to a shell.
        inline std::string display_quote(std::string_view token) {
            if (token.find_first_of(" \"'\\") == std::string_view::npos && !token.empty()) {
                return std::string{token};
            }
            std::string out{};
            out.reserve(token.size() + 2U);
            out.push_back('"');
            for (char c : token) {
                if (c == '"' || c == '\\') {
                    out.push_back('\\');
                }
                out.push_back(c);
            }
            out.push_back('"');
            return out;
        }

        // Replaces each ill-formed UTF-8 subsequence with U+FFFD.
        inline std::string to_valid_utf8(std::string_view in) {
            static constexpr std::string_view replacement{"\xEF\xBF\xBD"};

            std::string out{};
            out.reserve(in.size());
            size_t i = 0;
            while (i < in.size()) {
                auto lead = static_cast<unsigned char>(in[i]);
                if (lead < 0x80U) {
                    out.push_back(in[i++]);
                    continue;
                }

                size_t len = 0;
                unsigned char lo = 0x80U;
                unsigned char hi = 0xBFU;
                if (lead >= 0xC2U && lead <= 0xDFU) {
                    len = 2;
                }
                else if (lead >= 0xE0U && lead <= 0xEFU) {
                    len = 3;
                    lo = lead == 0xE0U ? 0xA0U : lo;  // overlong
                    hi = lead == 0xEDU ? 0x9FU : hi;  // surrogates
                }
                else if (lead >= 0xF0U && lead <= 0xF4U) {
                    len = 4;
                    lo = lead == 0xF0U ? 0x90U : lo;
                    hi = lead == 0xF4U ? 0x8FU : hi;
                }

                size_t n = 1;
                while (n < len && i + n < in.size()) {
                    auto c = static_cast<unsigned char>(in[i + n]);
                    if (c < (n == 1 ? lo : 0x80U) || c > (n == 1 ? hi : 0xBFU)) {
                        break;
                    }
                    ++n;
                }

                if (len != 0 && n == len) {
                    out.append(in.substr(i, len));
                }
                else {
                    out.append(replacement);
                }
                i += n;
            }
            return out;
        }

    }  // namespace utils

}  // namespace cargomcp
