#include "runlet/classifier.hpp"

#include <algorithm>

namespace runlet {

    source_kind classify_source(std::string_view source) noexcept {
        auto has_marker = std::ranges::any_of(
                commonjs_markers, [source](std::string_view marker) { return source.find(marker) != source.npos; });
        return has_marker ? source_kind::commonjs : source_kind::module;
    }

}  // namespace runlet
