#include "runlet/search.hpp"

#include "runlet/format.hpp"

#include "internal/chunker.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>
#include <stdexcept>
#include <system_error>

using namespace runlet::literals;
namespace fs = std::filesystem;

namespace runlet::search {

    namespace detail {

        static constexpr double name_weight = 2.0;
        static constexpr double name_prefix_weight = 0.75;
        static constexpr double body_weight = 1.0;
        static constexpr double body_repeat_weight = 0.25;
        static constexpr double max_term_score = name_weight + body_weight + 1.0;

        static bool is_lower(char c) { return c >= 'a' && c <= 'z'; }
        static bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
        static bool is_digit(char c) { return c >= '0' && c <= '9'; }

        static bool is_ignored(const fs::path& path, const std::vector<std::string>& ignores) {
            for (const auto& part : path) {
                auto name = part.string();
                if (std::ranges::find(ignores, name) != ignores.end()) {
                    return true;
                }
            }
            return false;
        }

        static bool has_extension(const fs::path& path, const std::vector<std::string>& extensions) {
            auto ext = path.extension().string();
            if (ext.size() < 2U) {
                return false;
            }
            return std::ranges::find(extensions, std::string_view{ext}.substr(1U)) != extensions.end();
        }

        static bool is_under(const fs::path& path, const fs::path& root) {
            auto [root_it, path_it] = std::mismatch(root.begin(), root.end(), path.begin(), path.end());
            return root_it == root.end();
        }

        static std::string read_file(const fs::path& path) {
            std::ifstream in{path, std::ios::binary};
            if (!in) {
                throw std::runtime_error("failed to read {}"_format(path.string()));
            }
            std::ostringstream buf{};
            buf << in.rdbuf();
            return buf.str();
        }

        static indexed_chunk index_chunk(internal::source_chunk chunk, const std::string& file) {
            indexed_chunk out{};
            out.name_terms = tokenize("{} {}"_format(chunk.qualified_name, chunk.kind));
            for (auto& term : tokenize(chunk.text)) {
                ++out.body_terms[term];
            }
            if (chunk.doc) {
                for (auto& term : tokenize(*chunk.doc)) {
                    ++out.body_terms[term];
                }
            }

            auto& hit = out.hit;
            hit.file = file;
            hit.start_line = chunk.start_line;
            hit.end_line = chunk.end_line;
            hit.kind = std::move(chunk.kind);
            hit.qualified_name = std::move(chunk.qualified_name);
            hit.structure = std::move(chunk.structure);
            hit.doc = std::move(chunk.doc);
            hit.lines = chunk.end_line - chunk.start_line + 1U;
            if (!chunk.snippet.empty()) {
                hit.code = std::move(chunk.snippet);
            }
            return out;
        }

        static double score_chunk(const indexed_chunk& chunk, const std::vector<std::string>& terms) {
            double total = 0.0;
            for (const auto& term : terms) {
                double term_score = 0.0;
                if (std::ranges::find(chunk.name_terms, term) != chunk.name_terms.end()) {
                    term_score += name_weight;
                }
                else if (std::ranges::any_of(chunk.name_terms, [&term](const std::string& name) {
                             return name.starts_with(term) || term.starts_with(name);
                         })) {
                    term_score += name_prefix_weight;
                }
                if (auto it = chunk.body_terms.find(term); it != chunk.body_terms.end()) {
                    term_score += body_weight + body_repeat_weight * std::log(static_cast<double>(it->second));
                }
                total += std::min(term_score, max_term_score);
            }
            return total / (max_term_score * static_cast<double>(terms.size()));
        }

    }  // namespace detail

    std::vector<std::string> tokenize(std::string_view text) {
        std::vector<std::string> terms{};
        std::string current{};

        auto flush = [&] {
            if (current.size() >= 2U) {
                terms.push_back(current);
            }
            current.clear();
        };

        for (size_t i = 0U; i < text.size(); ++i) {
            char c = text[i];
            bool alnum = detail::is_lower(c) || detail::is_upper(c) || detail::is_digit(c);
            if (!alnum) {
                flush();
                continue;
            }
            // fooBar -> foo bar; HTTPServer -> http server
            if (detail::is_upper(c) && !current.empty()) {
                char prev = text[i - 1U];
                char next = i + 1U < text.size() ? text[i + 1U] : '\0';
                if (detail::is_lower(prev) || detail::is_digit(prev) || (detail::is_upper(prev) && detail::is_lower(next))) {
                    flush();
                }
            }
            current.push_back(utils::char_tolower(c));
        }
        flush();
        return terms;
    }

    void lexical_index::sync(
            const std::vector<fs::path>& folders,
            const std::vector<std::string>& extensions,
            const std::vector<std::string>& ignores) {
        std::lock_guard lock{index_mutex};

        for (const auto& folder : folders) {
            std::error_code ec{};
            auto root = fs::weakly_canonical(folder, ec);
            if (ec || !fs::is_directory(root)) {
                throw std::runtime_error("search folder is not a directory: {}"_format(folder.string()));
            }

            std::set<std::string> seen{};
            auto options = fs::directory_options::skip_permission_denied;
            for (auto it = fs::recursive_directory_iterator(root, options, ec);
                 !ec && it != fs::recursive_directory_iterator();
                 it.increment(ec)) {
                const auto& entry = *it;
                auto relative = entry.path().lexically_relative(root);

                std::error_code entry_ec{};
                if (entry.is_directory(entry_ec)) {
                    if (detail::is_ignored(relative, ignores)) {
                        it.disable_recursion_pending();
                    }
                    continue;
                }
                if (!entry.is_regular_file(entry_ec) || detail::is_ignored(relative, ignores) ||
                    !detail::has_extension(entry.path(), extensions)) {
                    continue;
                }
                if (entry.file_size(entry_ec) > max_indexed_file_bytes || entry_ec) {
                    continue;
                }

                auto key = entry.path().string();
                seen.insert(key);
                auto mtime = entry.last_write_time(entry_ec);
                if (auto existing = files.find(key); existing != files.end() && existing->second.mtime == mtime) {
                    continue;
                }

                indexed_file indexed{.mtime = mtime, .chunks = {}};
                try {
                    auto text = detail::read_file(entry.path());
                    for (auto& chunk : internal::chunk_source(text, entry.path().filename().string())) {
                        indexed.chunks.push_back(detail::index_chunk(std::move(chunk), key));
                    }
                } catch (const std::exception& e) {
                    debug_log("skipping ", key, ": ", e.what());
                    continue;
                }
                files.insert_or_assign(key, std::move(indexed));
            }
            if (ec) {
                throw std::runtime_error("failed to walk {}: {}"_format(root.string(), ec.message()));
            }

            // drop files that vanished (or became ignored) under this root
            std::erase_if(files, [&](const auto& item) {
                return detail::is_under(fs::path{item.first}, root) && !seen.contains(item.first);
            });
        }
    }

    std::vector<search_hit> lexical_index::query(std::string_view text, size_t top_k) {
        auto terms = tokenize(text);
        std::ranges::sort(terms);
        auto [dup_begin, dup_end] = std::ranges::unique(terms);
        terms.erase(dup_begin, dup_end);
        if (terms.empty() || top_k == 0U) {
            return {};
        }

        std::vector<search_hit> hits{};
        {
            std::lock_guard lock{index_mutex};
            for (const auto& [path, file] : files) {
                for (const auto& chunk : file.chunks) {
                    auto score = detail::score_chunk(chunk, terms);
                    if (score <= 0.0) {
                        continue;
                    }
                    auto& hit = hits.emplace_back(chunk.hit);
                    hit.score = std::round(score * 1000.0) / 1000.0;
                }
            }
        }

        std::ranges::stable_sort(hits, [](const search_hit& lhs, const search_hit& rhs) {
            if (lhs.score != rhs.score) {
                return lhs.score > rhs.score;
            }
            if (lhs.file != rhs.file) {
                return lhs.file < rhs.file;
            }
            return lhs.start_line < rhs.start_line;
        });
        if (hits.size() > top_k) {
            hits.resize(top_k);
        }
        return hits;
    }

    size_t lexical_index::chunk_count() const {
        std::lock_guard lock{index_mutex};
        size_t count = 0U;
        for (const auto& [_, file] : files) {
            count += file.chunks.size();
        }
        return count;
    }

}  // namespace runlet::search
