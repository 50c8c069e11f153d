#include "runlet/temp_artifact.hpp"

#include "runlet/format.hpp"

extern "C" {
#include <fcntl.h>
#include <unistd.h>
}

#include <cerrno>
#include <chrono>
#include <cstring>
#include <random>
#include <stdexcept>
#include <system_error>

using namespace runlet::literals;
namespace fs = std::filesystem;

namespace runlet {

    namespace detail {

        static constexpr int max_create_attempts = 8;
        static constexpr size_t random_suffix_length = 10U;

        static std::string random_base36(size_t length) {
            static constexpr std::string_view alphabet = "0123456789abcdefghijklmnopqrstuvwxyz";
            thread_local std::mt19937_64 engine{std::random_device{}()};
            std::uniform_int_distribution<size_t> pick{0U, alphabet.size() - 1U};

            std::string out(length, '0');
            for (auto& c : out) {
                c = alphabet[pick(engine)];
            }
            return out;
        }

        static bool write_all(int fd, std::string_view contents) {
            while (!contents.empty()) {
                auto n = ::write(fd, contents.data(), contents.size());
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    return false;
                }
                contents.remove_prefix(static_cast<size_t>(n));
            }
            return true;
        }

    }  // namespace detail

    std::string make_artifact_name(std::string_view prefix, std::string_view extension) {
        auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::system_clock::now().time_since_epoch())
                              .count();
        return "{}{}-{}{}"_format(prefix, now_ms, detail::random_base36(detail::random_suffix_length), extension);
    }

    temp_artifact temp_artifact::create(
            const fs::path& dir, std::string_view prefix, std::string_view extension, std::string_view contents) {
        fs::create_directories(dir);

        for (int attempt = 0; attempt < detail::max_create_attempts; ++attempt) {
            auto path = dir / make_artifact_name(prefix, extension);
            int fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
            if (fd < 0) {
                if (errno == EEXIST || errno == EINTR) {
                    continue;
                }
                throw std::system_error(errno, std::generic_category(), "create {}"_format(path.string()));
            }

            // owns the name from here on, so a failed write still cleans up
            temp_artifact artifact{path};
            bool written = detail::write_all(fd, contents);
            int write_errno = errno;
            ::close(fd);
            if (!written) {
                throw std::system_error(write_errno, std::generic_category(), "write {}"_format(path.string()));
            }
            return artifact;
        }

        throw std::runtime_error("could not claim a unique file name under {}"_format(dir.string()));
    }

    temp_artifact::temp_artifact(temp_artifact&& other) noexcept : file_path(std::move(other.file_path)) {
        other.file_path.clear();
    }

    temp_artifact& temp_artifact::operator=(temp_artifact&& other) noexcept {
        if (this != &other) {
            remove();
            file_path = std::move(other.file_path);
            other.file_path.clear();
        }
        return *this;
    }

    temp_artifact::~temp_artifact() { remove(); }

    void temp_artifact::remove() noexcept {
        if (file_path.empty()) {
            return;
        }
        std::error_code ec{};
        fs::remove(file_path, ec);
        if (ec) {
            debug_log("temp artifact cleanup failed: ", file_path.string(), ": ", ec.message());
        }
        file_path.clear();
    }

}  // namespace runlet
