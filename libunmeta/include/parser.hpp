//
// Created by Giuseppe Francione on 02/02/26.
//

#ifndef UNMETA_PARSER_HPP
#define UNMETA_PARSER_HPP

#include "meta_value.hpp"
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

/**
 * @namespace unmeta
 * @brief The main namespace for the unmeta library.
 *
 * @details This namespace encapsulates all core functionality of unmeta,
 * including the abstract Parser contract, the concrete format parsers
 * (PngParser, JpegParser), the ParserRegistry, the Unmeta facade and the
 * helpers they share.
 */
namespace unmeta {

/**
 * @brief Outcome of the end-of-life swap of an in-place parser.
 *
 * Returned by Parser::finalize() instead of being printed, so the caller
 * decides whether to log, retry or propagate.
 */
struct SwapReport {
    enum class Status {
        NotInPlace, ///< Nothing to swap: the parser wrote a separate output file
        Swapped,    ///< The original now holds the cleaned content
        NotCleaned  ///< The original was left as it was; see reason
    };

    Status status = Status::NotInPlace;
    bool original_untouched = true;  ///< False only when Status::Swapped
    bool temp_removed = true;        ///< False if the temporary file is still on disk
    std::string reason;              ///< Why the original was not cleaned
    std::string cleanup_error;       ///< Why the temporary could not be removed

    [[nodiscard]] bool ok() const noexcept { return status != Status::NotCleaned; }
};

/**
 * @brief Contract shared by every format-specific metadata parser.
 *
 * A parser is bound to one file for its whole life. Callers construct it,
 * optionally read the metadata, optionally switch to lightweight cleaning
 * or in-place editing, run remove_all() once and finally release it.
 *
 * In-place editing writes the cleaned file to a private temporary path and
 * swaps it over the original when finalize() runs. finalize() is idempotent
 * and is invoked by the destructor if the caller did not call it.
 *
 * Concrete parsers must call finalize() from their own destructor. By the
 * time ~Parser() runs the derived part is gone, so an override of
 * move_over_original() would not be reached from there.
 *
 * Concrete parsers provide get_meta() and the two stripping hooks, and
 * declare their capabilities as static constexpr arrays (kMetaList,
 * kMimeTypes, kExtensions) surfaced through the virtual accessors below.
 */
class Parser {
public:
    enum class State {
        Constructed,
        InPlaceRequested,
        Cleaned,
        Failed,
        Swapped
    };

    /**
     * @param filename Path of the file to clean.
     * @throws InvalidInputError if the path cannot be a file reference.
     */
    explicit Parser(const std::filesystem::path& filename);
    virtual ~Parser();

    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;

    // --- self-description ---

    /// @return Human-readable name of the parser (e.g. "PngParser").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return Metadata carriers this parser understands and strips in lightweight mode.
    [[nodiscard]] virtual std::span<const std::string_view> get_meta_list() const noexcept = 0;

    /// @return Supported MIME types (e.g. "image/png").
    [[nodiscard]] virtual std::span<const std::string_view> get_supported_mime_types() const noexcept = 0;

    // --- operations ---

    /**
     * @brief Read the metadata embedded in filename().
     *
     * Never modifies the file. An empty map means the file carries no
     * metadata this parser can see.
     * @throws CleaningError if the file is truncated or corrupt.
     */
    [[nodiscard]] virtual MetaMap get_meta() const = 0;

    /**
     * @brief Write a copy of filename() without metadata to output_filename().
     * @return true on success.
     * @throws CleaningError if the rewrite cannot complete; filename() is untouched.
     * @throws StateError if the parser already ran a cleaning pass.
     */
    bool remove_all();

    /**
     * @brief Switch to in-place editing.
     *
     * Allocates a temporary file carrying the source extension and points
     * output_filename() at it. Must be called before remove_all().
     * @throws StateError if called twice or after cleaning.
     * @throws CleaningError if the temporary file cannot be created.
     */
    void set_edit_in_place();

    /**
     * @brief Swap the cleaned temporary over the original (in-place mode only).
     *
     * Runs at most once: later calls return the first report unchanged.
     * On any failure the temporary file is removed on a best-effort basis
     * and the original is left as it was.
     */
    SwapReport finalize() noexcept;

    // --- accessors ---

    [[nodiscard]] const std::filesystem::path& filename() const noexcept { return filename_; }
    [[nodiscard]] const std::filesystem::path& output_filename() const noexcept { return output_filename_; }
    [[nodiscard]] bool lightweight_cleaning() const noexcept { return lightweight_cleaning_; }
    void set_lightweight_cleaning(const bool value) noexcept { lightweight_cleaning_ = value; }
    [[nodiscard]] bool in_place() const noexcept { return in_place_; }
    [[nodiscard]] State state() const noexcept { return state_; }

    /**
     * @brief Rewrites a path so that it cannot be taken for a command-line flag.
     *
     * Paths whose first character is not a lowercase ASCII letter, a digit,
     * '.' or '/' are prefixed with "./".
     */
    [[nodiscard]] static std::filesystem::path sanitize(const std::filesystem::path& filename);

    /// @return "<stem>.cleaned<ext>" for the given (already sanitized) path.
    [[nodiscard]] static std::filesystem::path derive_output_filename(const std::filesystem::path& filename);

protected:
    /// Strip only the carriers listed in get_meta_list(), keeping everything else.
    virtual bool remove_all_lightweight() = 0;

    /// Strip everything, re-encoding the content where the format requires it.
    virtual bool remove_all_thorough() = 0;

    /**
     * @brief Move the cleaned temporary onto the original.
     *
     * Tries a rename first. When source and target live on different
     * devices, the temporary is copied to a staging file beside the target
     * and the staging file is renamed instead, so the target is replaced
     * atomically or not at all.
     */
    virtual void move_over_original(const std::filesystem::path& from,
                                    const std::filesystem::path& to,
                                    std::error_code& ec) noexcept;

private:
    std::filesystem::path filename_;
    std::filesystem::path output_filename_;
    bool lightweight_cleaning_ = false;
    bool in_place_ = false;
    bool finalized_ = false;
    State state_ = State::Constructed;
    SwapReport report_;
};

[[nodiscard]] std::string_view state_to_string(Parser::State state) noexcept;

} // namespace unmeta

#endif // UNMETA_PARSER_HPP
