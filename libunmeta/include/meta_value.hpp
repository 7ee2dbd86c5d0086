//
// Created by Giuseppe Francione on 02/02/26.
//

#ifndef UNMETA_META_VALUE_HPP
#define UNMETA_META_VALUE_HPP

#include <map>
#include <memory>
#include <string>

namespace unmeta {

    class MetaValue;

    /// Metadata field name -> value, ordered by name.
    using MetaMap = std::map<std::string, MetaValue>;

    /**
     * @brief A single metadata value: either a scalar string or a nested map.
     *
     * Nested maps model hierarchical metadata such as the EXIF sub-IFDs of
     * an image, or the per-language attributes of a PNG iTXt chunk.
     */
    class MetaValue {
    public:
        MetaValue() = default;
        MetaValue(std::string text) : text_(std::move(text)) {} // NOLINT(*-explicit-constructor)
        MetaValue(const char* text) : text_(text) {}             // NOLINT(*-explicit-constructor)
        MetaValue(MetaMap nested);                               // NOLINT(*-explicit-constructor)

        [[nodiscard]] bool is_nested() const noexcept { return nested_ != nullptr; }

        /// @return The scalar text; empty for nested values.
        [[nodiscard]] const std::string& text() const noexcept { return text_; }

        /// @return The nested map; an empty map for scalar values.
        [[nodiscard]] const MetaMap& nested() const;

        bool operator==(const MetaValue& other) const;

    private:
        std::string text_;
        // shared and immutable, so copies stay cheap
        std::shared_ptr<const MetaMap> nested_;
    };

    /**
     * @brief Inserts key into meta, renaming repeats to "key 2", "key 3", ...
     */
    void add_meta(MetaMap& meta, const std::string& key, MetaValue value);

} // namespace unmeta

#endif // UNMETA_META_VALUE_HPP
