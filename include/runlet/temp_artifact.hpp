#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace runlet {

    /*
     * A uniquely named source file that exists for the lifetime of this handle.
     *
     * create() makes the parent directory when missing and claims the name with an
     * exclusive create, so concurrent callers sharing a directory never collide.
     * The destructor removes the file; a removal failure (including the file having
     * been deleted by someone else) is ignored.
     */
    class temp_artifact {
      public:
        static temp_artifact create(
                const std::filesystem::path& dir,
                std::string_view prefix,
                std::string_view extension,
                std::string_view contents);

        temp_artifact(const temp_artifact&) = delete;
        temp_artifact& operator=(const temp_artifact&) = delete;

        temp_artifact(temp_artifact&& other) noexcept;
        temp_artifact& operator=(temp_artifact&& other) noexcept;

        ~temp_artifact();

        const std::filesystem::path& path() const noexcept { return file_path; }

      private:
        explicit temp_artifact(std::filesystem::path p) : file_path(std::move(p)) {}

        void remove() noexcept;

        std::filesystem::path file_path{};
    };

    // "{prefix}{epoch_ms}-{random base36}{extension}"
    std::string make_artifact_name(std::string_view prefix, std::string_view extension);

}  // namespace runlet
