#include "path/Subscript.hpp"

#include "path/Numeric.hpp"

#include <string>

namespace SC {

auto Subscript::encode() const -> Expected<Encoded> {
    if (auto const* bytes = std::get_if<std::string_view>(&this->value_)) {
        return Encoded{*bytes};
    }
    if (auto const* number = std::get_if<std::int64_t>(&this->value_)) {
        return Encoded{canonical_number(*number)};
    }
    if (auto const* number = std::get_if<std::uint64_t>(&this->value_)) {
        return Encoded{canonical_number(*number)};
    }
    auto text = canonical_number(std::get<double>(this->value_));
    if (!text) {
        return std::unexpected(text.error());
    }
    return Encoded{std::move(*text)};
}

auto SubscriptBatch::encode(std::span<Subscript const> subscripts, Limits const& limits)
    -> Expected<SubscriptBatch> {
    if (subscripts.size() > kMaxSubscripts || subscripts.size() > limits.maxSubscripts) {
        return std::unexpected(Error{Error::Code::TooManySubscripts,
                                     "Batch of " + std::to_string(subscripts.size())
                                         + " subscripts exceeds the limit of "
                                         + std::to_string(limits.maxSubscripts)});
    }

    SubscriptBatch batch;
    for (auto const& subscript : subscripts) {
        auto encoded = subscript.encode();
        if (!encoded) {
            return std::unexpected(Error{encoded.error().code,
                                         "Subscript " + std::to_string(batch.count_ + 1) + ": "
                                             + encoded.error().message.value_or("")});
        }
        auto const length = encoded->bytes().size();
        if (length > limits.maxSubscriptLength) {
            return std::unexpected(Error{Error::Code::SubscriptTooLong,
                                         "Subscript " + std::to_string(batch.count_ + 1) + " is "
                                             + std::to_string(length) + " bytes; the limit is "
                                             + std::to_string(limits.maxSubscriptLength)});
        }
        batch.totalBytes_ += length;
        batch.items_[batch.count_++] = std::move(*encoded);
    }
    return batch;
}

} // namespace SC
