#pragma once

#include <array>
#include <string_view>

namespace runlet {

    using namespace std::string_view_literals;

    enum class source_kind { module, commonjs };

    inline constexpr std::string_view to_string(source_kind kind) {
        switch (kind) {
            case source_kind::module:
                return "module"sv;
            case source_kind::commonjs:
                return "commonjs"sv;
        }
        return "module"sv;
    }

    // Plain substring markers: occurrences inside comments or string literals count too.
    inline constexpr std::array<std::string_view, 5> commonjs_markers{
            "require("sv, "module.exports"sv, "__dirname"sv, "__filename"sv, "exports."sv};

    source_kind classify_source(std::string_view source) noexcept;

}  // namespace runlet
