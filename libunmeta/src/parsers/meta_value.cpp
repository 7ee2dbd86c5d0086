//
// Created by Giuseppe Francione on 02/02/26.
//

#include "../../include/meta_value.hpp"

namespace unmeta {

MetaValue::MetaValue(MetaMap nested)
    : nested_(std::make_shared<const MetaMap>(std::move(nested))) {}

const MetaMap& MetaValue::nested() const {
    static const MetaMap kEmpty;
    return nested_ ? *nested_ : kEmpty;
}

bool MetaValue::operator==(const MetaValue& other) const {
    if (is_nested() != other.is_nested()) return false;
    if (is_nested()) return *nested_ == *other.nested_;
    return text_ == other.text_;
}

void add_meta(MetaMap& meta, const std::string& key, MetaValue value) {
    if (meta.emplace(key, value).second) return;
    for (int n = 2;; ++n) {
        if (meta.emplace(key + " " + std::to_string(n), value).second) return;
    }
}

} // namespace unmeta
