//
// Created by Giuseppe Francione on 19/10/25.
//

/**
 * @file parser_registry.hpp
 * @brief Defines the registry that maps file types to Parser implementations.
 */

#ifndef UNMETA_PARSER_REGISTRY_HPP
#define UNMETA_PARSER_REGISTRY_HPP

#include "parser.hpp"
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace unmeta {

/**
 * @brief Static description of one Parser implementation and how to build it.
 */
struct ParserEntry {
    std::string_view name;
    std::span<const std::string_view> mime_types;
    std::span<const std::string_view> extensions;
    std::span<const std::string_view> meta_list;
    std::function<std::unique_ptr<Parser>(const std::filesystem::path&)> create;
};

/**
 * @brief Registry of all available parsers in unmeta.
 *
 * @details Parsers are bound to a single file, so the registry stores
 * factories rather than instances. It answers which parser handles a MIME
 * type or an extension, and builds one for a given file.
 */
class ParserRegistry {
public:
    /**
     * @brief Construct and register all built-in parsers (PngParser, JpegParser).
     */
    ParserRegistry();

    /**
     * @brief Register a parser type.
     *
     * T must derive from Parser, be constructible from a path and expose
     * static kName, kMimeTypes, kExtensions and kMetaList.
     */
    template <typename T>
    void add() {
        entries_.push_back(ParserEntry{
            T::kName,
            std::span<const std::string_view>(T::kMimeTypes),
            std::span<const std::string_view>(T::kExtensions),
            std::span<const std::string_view>(T::kMetaList),
            [](const std::filesystem::path& p) -> std::unique_ptr<Parser> { return std::make_unique<T>(p); }
        });
    }

    /**
     * @brief Find all parsers that support a given MIME type.
     * @param mime MIME type string (e.g. "image/png").
     */
    [[nodiscard]] std::vector<const ParserEntry*> find_by_mime(std::string_view mime) const;

    /**
     * @brief Find all parsers that support a given file extension.
     *
     * Comparison is case-insensitive.
     *
     * @param ext File extension (including the dot, e.g. ".png").
     */
    [[nodiscard]] std::vector<const ParserEntry*> find_by_extension(std::string_view ext) const;

    /**
     * @brief Build a parser for a file.
     *
     * The MIME type detected from the content decides; the extension is
     * only consulted when detection yields nothing usable.
     *
     * @return The parser, or nullptr if no registered parser handles the file.
     * @throws InvalidInputError if the matching parser rejects the file.
     */
    [[nodiscard]] std::unique_ptr<Parser> create_for(const std::filesystem::path& path) const;

    /**
     * @brief Access all registered parsers.
     */
    [[nodiscard]] const std::vector<ParserEntry>& all() const { return entries_; }

private:
    std::vector<ParserEntry> entries_;
};

} // namespace unmeta

#endif // UNMETA_PARSER_REGISTRY_HPP
