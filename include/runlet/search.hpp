#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace runlet::search {

    struct parameter_info {
        std::string name{};
        std::optional<std::string> type{};
    };

    struct symbol_structure {
        std::vector<parameter_info> parameters{};
        std::optional<std::string> return_type{};
        std::optional<std::string> parent_class{};
        std::optional<std::string> inherits_from{};
        std::vector<std::string> calls{};
    };

    struct search_hit {
        double score{};
        std::string file{};
        size_t start_line{};
        size_t end_line{};
        std::string kind{};
        std::string qualified_name{};
        symbol_structure structure{};
        std::optional<std::string> doc{};
        size_t lines{};
        std::optional<std::string> code{};
    };

    // Index of source symbols. Implementations serialize their own state; sync and
    // query may be called from several threads.
    class code_index {
      public:
        virtual ~code_index() = default;

        // Brings the index up to date with the files under `folders` whose extension
        // (without the dot) is listed, skipping paths with a component in `ignores`.
        virtual void sync(
                const std::vector<std::filesystem::path>& folders,
                const std::vector<std::string>& extensions,
                const std::vector<std::string>& ignores) = 0;

        // Best `top_k` hits, best first.
        virtual std::vector<search_hit> query(std::string_view text, size_t top_k) = 0;
    };

    struct indexed_chunk {
        search_hit hit{};
        std::vector<std::string> name_terms{};
        std::map<std::string, size_t, std::less<>> body_terms{};
    };

    struct indexed_file {
        std::filesystem::file_time_type mtime{};
        std::vector<indexed_chunk> chunks{};
    };

    /*
     * Term-overlap index over JavaScript/TypeScript declarations.
     *
     * Files are split into function, class and method chunks (or one whole-file chunk
     * when nothing is recognized). Matches in a chunk's name weigh more than matches in
     * its doc comment or body. Unchanged files (same mtime) are not re-read on sync.
     */
    class lexical_index final : public code_index {
      public:
        void sync(
                const std::vector<std::filesystem::path>& folders,
                const std::vector<std::string>& extensions,
                const std::vector<std::string>& ignores) override;

        std::vector<search_hit> query(std::string_view text, size_t top_k) override;

        size_t chunk_count() const;

      private:
        mutable std::mutex index_mutex{};
        std::map<std::string, indexed_file> files{};
    };

    // lower-cased terms; camelCase and snake_case identifiers are split
    std::vector<std::string> tokenize(std::string_view text);

    inline constexpr size_t max_indexed_file_bytes = 1U << 20U;

}  // namespace runlet::search
